#include "capturepush/orchestrator.hpp"
#include "capturepush/account_sync_target.hpp"
#include "capturepush/plugin_exception.hpp"
#include "capturepush/sync_exception.hpp"

#include <set>

Orchestrator::Orchestrator(AppContext ctx) :
    _ctx(ctx)
{
    SchedulerOptions options;
    options.maxRetries = _ctx.config->maxRetries;
    options.backoffBase = std::chrono::seconds(_ctx.config->backoffBase);
    options.backoffMax = std::chrono::seconds(_ctx.config->backoffMax);
    options.phaseTimeout = std::chrono::seconds(_ctx.config->phaseTimeout);

    _scheduler = std::unique_ptr<PollingScheduler>(new PollingScheduler(options, _ctx.logger, [this](const CycleResult & result) {
        onCycle(result);
    }));
}

Orchestrator::~Orchestrator() {
    stop();
}

void Orchestrator::registerChannels() {
    for (const auto & config : _ctx.config->channels) {
        try {
            _ctx.dispatcher->registerChannel(config.name, _ctx.channels->create(config), config.enabled);
            _ctx.logger->info("Registered {} channel {} ({})", config.type(), config.name, config.enabled ? "enabled" : "disabled");
        } catch (LoadException & ex) {
            _ctx.logger->error("Unable to create notification channel: {}", ex.toJSON().dump());
        }
    }
}

void Orchestrator::startTargets(bool immediate) {
    std::set<std::string> updated;
    std::chrono::milliseconds jitter = std::chrono::seconds(_ctx.config->jitter);

    for (const auto & account : _ctx.config->accounts) {
        std::string code = account.schoolCode;

        if (_ctx.config->autoUpdatePlugins && !updated.count(code)) {
            updated.insert(code);
            try {
                _ctx.registry->updateIfNewer(code);
            } catch (PluginException & ex) {
                _ctx.logger->error("Adapter update for {} failed: {}", code, ex.toJSON().dump());
            } catch (SyncException & ex) {
                _ctx.logger->error("Adapter update for {} failed: {}", code, ex.toJSON().dump());
            }
        }

        std::shared_ptr<SchoolAdapter> adapter;
        try {
            adapter = _ctx.registry->resolve(code);
        } catch (PluginException & ex) {
            _ctx.logger->error("Skipping account {}: {}", account.accountKey(), ex.toJSON().dump());
            std::lock_guard<std::mutex> lock(_skippedMtx);
            _skipped[account.accountKey()] = ex.toJSON();
            continue;
        }

        std::vector<std::pair<std::string, TargetConfig>> kinds = {
            {RECORD_KIND_GRADES, account.grades},
            {RECORD_KIND_SCHEDULE, account.schedule},
        };
        for (const auto & kind : kinds) {
            if (!kind.second.enabled) {
                continue;
            }
            auto target = std::make_shared<AccountSyncTarget>(account, kind.first, adapter, _ctx.store, _ctx.dispatcher, _ctx.logger);
            _scheduler->start(target, std::chrono::seconds(kind.second.interval), jitter, immediate);
            _targetIds.push_back(target->targetId());
        }
    }
}

void Orchestrator::start() {
    registerChannels();
    startTargets(true);
    _ctx.logger->info("Polling {} target(s)", _targetIds.size());
}

std::vector<CycleResult> Orchestrator::runOnce() {
    if (_targetIds.empty()) {
        registerChannels();
        startTargets(false);
    }

    std::vector<std::shared_future<CycleResult>> futures;
    for (const auto & id : _targetIds) {
        futures.push_back(_scheduler->forceCycle(id));
    }
    std::vector<CycleResult> results;
    for (auto & future : futures) {
        results.push_back(future.get());
    }
    return results;
}

void Orchestrator::stop() {
    _scheduler->stopAll();
    _targetIds.clear();
}

std::vector<std::string> Orchestrator::targetIds() {
    return _targetIds;
}

nlohmann::json Orchestrator::skippedAccounts() {
    std::lock_guard<std::mutex> lock(_skippedMtx);
    nlohmann::json result = nlohmann::json::object();
    for (const auto & pair : _skipped) {
        result[pair.first] = pair.second;
    }
    return result;
}

void Orchestrator::onCycle(const CycleResult & result) {
    switch (result.status) {
        case CycleStatus::FetchFailed:
            _ctx.logger->error("[{}] fetch failed after {} attempt(s): {}", result.targetId, result.attempts, result.error);
            break;
        case CycleStatus::Failed:
            _ctx.logger->error("[{}] cycle failed: {}", result.targetId, result.error);
            break;
        default:
            _ctx.logger->info("[{}] cycle finished: {}", result.targetId, result.toJSON().dump());
            break;
    }
}
