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

#include "engine.h"
#include "../util/log.h"

namespace dualwrite {

    namespace {

        const DualWriteConfig& validated(const DualWriteConfig& config) {
            config.validate();
            return config;
        }

    }

    Engine::Engine(const DualWriteConfig& config,
                   persist::StoreAdapter& primary,
                   persist::StoreAdapter& secondary)
        : config_(validated(config)), primary_(primary), secondary_(secondary) {
        metrics_ = std::make_unique<DualWriteMetrics>(config_.service_name, config_.metrics_enabled);
        if (config_.journal_dir.empty()) {
            ledger_ = std::make_unique<WriteLedger>();
        } else {
            ledger_ = std::make_unique<WriteLedger>(config_.journal_dir);
        }
        retries_ = std::make_unique<RetryQueue>(config_, secondary_, serializer_, *ledger_, *metrics_);
        coordinator_ = std::make_unique<Coordinator>(config_, primary_, secondary_, serializer_,
                                                     *ledger_, *retries_, *metrics_);
        validator_ = std::make_unique<SyncValidator>(config_, primary_, secondary_, registry_,
                                                     serializer_, *coordinator_, *metrics_);
        info() << "dual write engine ready: primary=" << primary_.name()
               << " secondary=" << secondary_.name() << ' ' << config_.describe();
    }

    Engine::~Engine() {
        stop();
    }

    void Engine::start() {
        retries_->start();
        validator_->start();
    }

    void Engine::stop() {
        validator_->stop();
        retries_->stop();
    }

    void Engine::register_entity(EntitySpec spec) {
        registry_.register_type(std::move(spec));
    }

    DualWriteResult Engine::execute(const Operation& op) {
        return coordinator_->execute(op);
    }

    DualWriteResult Engine::create(const std::string& entity_type, const std::string& entity_key,
                                   Payload payload) {
        return execute(Operation::make(entity_type, entity_key, OpKind::Create, std::move(payload)));
    }

    DualWriteResult Engine::update(const std::string& entity_type, const std::string& entity_key,
                                   Payload payload) {
        return execute(Operation::make(entity_type, entity_key, OpKind::Update, std::move(payload)));
    }

    DualWriteResult Engine::remove(const std::string& entity_type, const std::string& entity_key) {
        return execute(Operation::make(entity_type, entity_key, OpKind::Delete));
    }

    EngineStatus Engine::status() const {
        EngineStatus s;
        s.service_name = config_.service_name;
        s.enabled = config_.enabled;
        s.write_to_new = config_.write_to_new;
        s.write_to_legacy = config_.write_to_legacy;
        s.async_legacy = config_.async_legacy;

        s.operations = metrics_->ops_total.value();
        s.successes = metrics_->ops_success.value();
        s.partial_successes = metrics_->ops_partial.value();
        s.failures = metrics_->ops_failed.value();

        s.retry_depth = retries_->depth();
        if (auto oldest = retries_->oldest_pending_enqueued_at()) {
            auto age = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - *oldest);
            s.oldest_pending_retry_age = age.count() < 0 ? std::chrono::milliseconds(0) : age;
        }
        s.retries_abandoned = metrics_->retries_abandoned.value();
        s.retry_worker_running = retries_->running();
        s.ledger_entries = ledger_->size();
        s.ledger_journal_failures = ledger_->journal_failures();

        if (auto pass = validator_->last_pass()) {
            s.last_validation_at = pass->finished_at;
            s.last_validation_mismatches = pass->mismatches;
        }
        s.validator_running = validator_->running();
        return s;
    }

    size_t Engine::prune_ledger() {
        return retries_->prune_ledger(Clock::now());
    }

    StoreHealth Engine::check_store(persist::StoreAdapter& store) {
        StoreHealth h;
        h.store = store.name();
        Timer timer;
        persist::StoreResult r;
        try {
            r = store.ping(persist::deadline_after(config_.store_timeout));
        } catch (const std::exception& e) {
            r = persist::StoreResult::failure(ErrorCode::StoreError, e.what());
        }
        h.latency = std::chrono::microseconds(timer.elapsed_us());
        h.ok = r.ok;
        h.code = r.code;
        h.message = r.message;
        return h;
    }

    HealthReport Engine::health() {
        HealthReport report;
        report.primary = check_store(primary_);
        report.secondary = check_store(secondary_);
        report.legacy_required = config_.legacy_writes_active();
        if (!report.healthy()) {
            warning() << "health check: " << report.describe();
        }
        return report;
    }

    void Engine::set_abandon_callback(RetryQueue::AbandonCallback cb) {
        retries_->set_abandon_callback(std::move(cb));
    }

} // namespace dualwrite
