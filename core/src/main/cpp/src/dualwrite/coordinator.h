/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <string>

#include "config.h"
#include "key_serializer.h"
#include "metrics.h"
#include "retry_queue.h"
#include "types.h"
#include "write_ledger.h"
#include "../persistence/store_adapter.h"

namespace dualwrite {

    /**
     * Applies one logical operation to the primary (new) and secondary
     * (legacy) stores under the configured failure policy.
     *
     * A primary failure is always fatal and the secondary is then left
     * untouched. A failed synchronous secondary write is queued for retry
     * and reported as PartialSuccess, or Failed under fail_on_legacy_error.
     * Resubmitting a finished operation id returns the recorded result.
     *
     * Holds no per-call state; callers on different keys run in parallel.
     */
    class Coordinator {
    public:
        Coordinator(const DualWriteConfig& config,
                    persist::StoreAdapter& primary,
                    persist::StoreAdapter& secondary,
                    KeySerializer& serializer,
                    WriteLedger& ledger,
                    RetryQueue& retries,
                    DualWriteMetrics& metrics);

        DualWriteResult execute(const Operation& op);

        // Copies the primary's current value (or absence) to the secondary.
        // The primary is only read; its outcome is recorded as Skipped.
        // Fails without touching either store while legacy writes are off.
        DualWriteResult repair_secondary(const std::string& entity_type,
                                         const std::string& entity_key);

    private:
        WriteOutcome invoke(persist::StoreAdapter& store, StoreRole role,
                            const Operation& op, uint32_t attempt);
        WriteOutcome skipped(const Operation& op, StoreRole role, ErrorCode code,
                             const std::string& reason) const;
        // Queues the secondary write behind the key's pending retries
        void defer_secondary(const Operation& op, DualWriteResult& result);
        void finish(const Operation& op, DualWriteResult& result);

        const DualWriteConfig& config_;
        persist::StoreAdapter& primary_;
        persist::StoreAdapter& secondary_;
        KeySerializer& serializer_;
        WriteLedger& ledger_;
        RetryQueue& retries_;
        DualWriteMetrics& metrics_;
    };

} // namespace dualwrite
