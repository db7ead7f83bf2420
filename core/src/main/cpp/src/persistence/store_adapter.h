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
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../dualwrite/types.h"

namespace dualwrite {
    namespace persist {

        using Deadline = std::chrono::steady_clock::time_point;

        inline Deadline deadline_after(std::chrono::milliseconds timeout) {
            return std::chrono::steady_clock::now() + timeout;
        }

        inline bool expired(Deadline d) {
            return std::chrono::steady_clock::now() >= d;
        }

        // Result of a mutating call. Failures are values, never exceptions.
        struct StoreResult {
            bool ok = true;
            ErrorCode code = ErrorCode::None;
            std::string message;
            bool noop = false;    // delete of an absent key

            static StoreResult success(bool noop = false) {
                StoreResult r;
                r.noop = noop;
                return r;
            }
            static StoreResult failure(ErrorCode code, std::string message) {
                StoreResult r;
                r.ok = false;
                r.code = code;
                r.message = std::move(message);
                return r;
            }
        };

        struct ReadResult {
            bool ok = true;
            ErrorCode code = ErrorCode::None;
            std::string message;
            std::optional<Payload> value;   // empty when the key is absent

            bool found() const { return ok && value.has_value(); }

            static ReadResult failure(ErrorCode code, std::string message) {
                ReadResult r;
                r.ok = false;
                r.code = code;
                r.message = std::move(message);
                return r;
            }
        };

        // Keys strictly greater than the requested after_key, ascending
        struct KeyPage {
            bool ok = true;
            ErrorCode code = ErrorCode::None;
            std::string message;
            std::vector<std::string> keys;
            bool done = true;     // no keys remain after the last one returned

            static KeyPage failure(ErrorCode code, std::string message) {
                KeyPage p;
                p.ok = false;
                p.code = code;
                p.message = std::move(message);
                return p;
            }
        };

        /**
         * Uniform access to one backing store. Implementations must honor the
         * deadline (returning ErrorCode::Timeout once it passes) and must not
         * let exceptions escape.
         *
         * put() semantics by kind:
         *   Create  fails with DuplicateKey when the key exists
         *   Update  replaces the value, inserting it when absent
         * remove() of an absent key succeeds with noop set.
         */
        class StoreAdapter {
        public:
            virtual ~StoreAdapter() = default;

            virtual StoreResult put(const EntityKey& key, OpKind kind,
                                    const Payload& payload, Deadline deadline) = 0;
            virtual StoreResult remove(const EntityKey& key, Deadline deadline) = 0;
            virtual ReadResult get(const EntityKey& key, Deadline deadline) = 0;
            virtual KeyPage scan_keys(const std::string& entity_type,
                                      const std::string& after_key,
                                      size_t limit,
                                      Deadline deadline) = 0;
            virtual StoreResult ping(Deadline deadline) = 0;
            virtual std::string name() const = 0;
        };

    } // namespace persist
} // namespace dualwrite
