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

#include <memory>
#include <string>

#include "config.h"
#include "coordinator.h"
#include "entity_registry.h"
#include "key_serializer.h"
#include "metrics.h"
#include "retry_queue.h"
#include "status.h"
#include "sync_validator.h"
#include "types.h"
#include "write_ledger.h"
#include "../persistence/store_adapter.h"

namespace dualwrite {

    /**
     * Everything one service needs for dual writes, wired together.
     *
     * The engine validates and keeps its own copy of the config. The two
     * store adapters are borrowed and must outlive it. With a journal
     * directory configured the ledger and the retry queue are durable and
     * are recovered here.
     *
     *   DualWriteConfig cfg = DualWriteConfig::from_env("cart-service");
     *   Engine engine(cfg, new_db, legacy_db);
     *   engine.register_entity({"cart", {"user_id", "total"}, {}, {}});
     *   engine.start();
     *   DualWriteResult r = engine.update("cart", "c-42", payload);
     */
    class Engine {
    public:
        Engine(const DualWriteConfig& config,
               persist::StoreAdapter& primary,
               persist::StoreAdapter& secondary);
        ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        // Retry drain thread, and the periodic validator when validate_sync
        void start();
        void stop();

        void register_entity(EntitySpec spec);

        DualWriteResult execute(const Operation& op);
        DualWriteResult create(const std::string& entity_type, const std::string& entity_key,
                               Payload payload);
        DualWriteResult update(const std::string& entity_type, const std::string& entity_key,
                               Payload payload);
        DualWriteResult remove(const std::string& entity_type, const std::string& entity_key);

        EngineStatus status() const;
        HealthReport health();

        void set_abandon_callback(RetryQueue::AbandonCallback cb);

        // Same pruning the retry worker runs every RetryQueue::kLedgerPruneInterval
        size_t prune_ledger();

        const DualWriteConfig& config() const { return config_; }
        EntityRegistry& registry() { return registry_; }
        KeySerializer& serializer() { return serializer_; }
        WriteLedger& ledger() { return *ledger_; }
        RetryQueue& retry_queue() { return *retries_; }
        Coordinator& coordinator() { return *coordinator_; }
        SyncValidator& validator() { return *validator_; }
        DualWriteMetrics& metrics() { return *metrics_; }

    private:
        StoreHealth check_store(persist::StoreAdapter& store);

        const DualWriteConfig config_;
        persist::StoreAdapter& primary_;
        persist::StoreAdapter& secondary_;

        std::unique_ptr<DualWriteMetrics> metrics_;
        EntityRegistry registry_;
        KeySerializer serializer_;
        std::unique_ptr<WriteLedger> ledger_;
        std::unique_ptr<RetryQueue> retries_;
        std::unique_ptr<Coordinator> coordinator_;
        std::unique_ptr<SyncValidator> validator_;
    };

} // namespace dualwrite
