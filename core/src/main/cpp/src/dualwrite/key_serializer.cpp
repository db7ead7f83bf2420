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

#include "key_serializer.h"

#include "../util/log.h"

namespace dualwrite {

    KeySerializer::Lease::Lease(Lease&& o) noexcept
        : owner_(o.owner_), key_(std::move(o.key_)) {
        o.owner_ = nullptr;
    }

    KeySerializer::Lease& KeySerializer::Lease::operator=(Lease&& o) noexcept {
        if (this != &o) {
            release();
            owner_ = o.owner_;
            key_ = std::move(o.key_);
            o.owner_ = nullptr;
        }
        return *this;
    }

    void KeySerializer::Lease::release() {
        if (owner_) {
            KeySerializer* owner = owner_;
            owner_ = nullptr;
            owner->release_key(key_);
        }
    }

    KeySerializer::Lease KeySerializer::acquire(const EntityKey& key) {
        std::unique_lock<std::mutex> lk(mu_);
        auto& slot = slots_[key];
        if (!slot) {
            slot = std::make_unique<Slot>();
        }
        // The map may rehash while we wait; the Slot itself does not move
        Slot* s = slot.get();
        const uint64_t ticket = s->next_ticket++;
        s->users++;
        s->cv.wait(lk, [s, ticket] { return s->serving == ticket; });
        return Lease(this, key);
    }

    KeySerializer::Lease KeySerializer::try_acquire(const EntityKey& key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = slots_.find(key);
        if (it != slots_.end()) {
            return Lease();
        }
        auto slot = std::make_unique<Slot>();
        slot->next_ticket = 1;
        slot->users = 1;
        slots_.emplace(key, std::move(slot));
        return Lease(this, key);
    }

    void KeySerializer::release_key(const EntityKey& key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            severe() << "lease released for unknown key " << key.str();
            return;
        }
        Slot* s = it->second.get();
        s->serving++;
        s->users--;
        if (s->users == 0) {
            slots_.erase(it);
        } else {
            s->cv.notify_all();
        }
    }

    size_t KeySerializer::slot_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return slots_.size();
    }

} // namespace dualwrite
