#include "capturepush/polling_scheduler.hpp"
#include "capturepush/constants.hpp"
#include "capturepush/generic_exception.hpp"
#include "capturepush/sync_exception.hpp"
#include "capturepush/thread_utils.hpp"

#include <algorithm>
#include <random>

struct PollingScheduler::Worker {
    std::string id;
    std::shared_ptr<PollingTarget> target;
    std::chrono::milliseconds interval;
    std::chrono::milliseconds jitter;
    bool immediate;

    std::mutex mtx;
    std::condition_variable cv;
    TargetState state;
    bool stopRequested;
    bool cycleInFlight;
    std::shared_future<CycleResult> currentFuture;
    std::shared_ptr<std::promise<CycleResult>> pendingPromise;
    std::shared_future<CycleResult> pendingFuture;

    // held while the listener runs; once detached no listener call is made
    std::mutex listenerMtx;
    bool listenerDetached;

    std::thread thread;
    std::promise<void> exited;
    std::shared_future<void> exitedFuture;
};

std::string TargetStateToString(TargetState state) {
    switch (state) {
        case TargetState::Idle:
            return "idle";
        case TargetState::Fetching:
            return "fetching";
        case TargetState::Diffing:
            return "diffing";
        case TargetState::Dispatching:
            return "dispatching";
        case TargetState::Backoff:
            return "backoff";
        case TargetState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::string CycleStatusToString(CycleStatus status) {
    switch (status) {
        case CycleStatus::Unchanged:
            return "unchanged";
        case CycleStatus::Baseline:
            return "baseline";
        case CycleStatus::Changed:
            return "changed";
        case CycleStatus::FetchFailed:
            return "fetch-failed";
        case CycleStatus::Failed:
            return "failed";
        case CycleStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

nlohmann::json CycleResult::toJSON() const {
    nlohmann::json j = {
        {"target", targetId},
        {"status", CycleStatusToString(status)},
        {"changes", changeCount},
        {"attempts", attempts},
        {"forced", forced},
        {"deliveries", deliveries},
    };
    if (error != "") {
        j["error"] = error;
    }
    return j;
}

SchedulerOptions::SchedulerOptions() :
    maxRetries(DEFAULT_MAX_RETRIES),
    backoffBase(std::chrono::seconds(DEFAULT_BACKOFF_BASE)),
    backoffMax(std::chrono::seconds(DEFAULT_BACKOFF_MAX)),
    phaseTimeout(std::chrono::seconds(DEFAULT_PHASE_TIMEOUT))
{
}

static CycleResult emptyResult(std::string targetId, CycleStatus status, bool forced) {
    CycleResult result;
    result.targetId = targetId;
    result.status = status;
    result.changeCount = 0;
    result.attempts = 0;
    result.forced = forced;
    return result;
}

PollingScheduler::PollingScheduler(SchedulerOptions options, std::shared_ptr<spdlog::logger> logger, CycleListener listener) :
    _options(options), _logger(logger), _listener(listener)
{
}

PollingScheduler::~PollingScheduler() {
    stopAll();
}

std::chrono::milliseconds PollingScheduler::backoffDelay(const SchedulerOptions & options, int attempt) {
    std::chrono::milliseconds delay = options.backoffBase;
    for (int i = 0; i < attempt; i++) {
        delay *= 2;
        if (delay >= options.backoffMax) {
            return options.backoffMax;
        }
    }
    return std::min(delay, options.backoffMax);
}

void PollingScheduler::start(std::shared_ptr<PollingTarget> target, std::chrono::milliseconds interval, std::chrono::milliseconds jitter, bool immediate) {
    auto worker = std::make_shared<Worker>();
    worker->id = target->targetId();
    worker->target = target;
    worker->interval = interval;
    worker->jitter = jitter;
    worker->immediate = immediate;
    worker->state = TargetState::Idle;
    worker->stopRequested = false;
    worker->cycleInFlight = false;
    worker->listenerDetached = false;
    worker->exitedFuture = worker->exited.get_future().share();

    std::lock_guard<std::mutex> lock(_mtx);
    if (_workers.count(worker->id)) {
        throw GenericException("Polling target " + worker->id + " is already running");
    }
    _workers[worker->id] = worker;
    worker->thread = std::thread(&PollingScheduler::run, worker, _options, _logger, _listener);
    _logger->info("Started polling {} every {}s (+-{}s)", worker->id, (long long)(interval.count() / 1000), (long long)(jitter.count() / 1000));
}

std::shared_future<CycleResult> PollingScheduler::forceCycle(std::string targetId) {
    std::shared_ptr<Worker> worker;
    {
        std::lock_guard<std::mutex> lock(_mtx);
        auto it = _workers.find(targetId);
        if (it == _workers.end()) {
            throw GenericException("No polling target named " + targetId);
        }
        worker = it->second;
    }

    std::lock_guard<std::mutex> lock(worker->mtx);
    if (worker->stopRequested) {
        std::promise<CycleResult> cancelled;
        cancelled.set_value(emptyResult(targetId, CycleStatus::Cancelled, true));
        return cancelled.get_future().share();
    }
    if (worker->cycleInFlight) {
        _logger->debug("Forced cycle for {} joins the cycle in flight", targetId);
        return worker->currentFuture;
    }
    if (worker->pendingPromise) {
        return worker->pendingFuture;
    }
    worker->pendingPromise = std::make_shared<std::promise<CycleResult>>();
    worker->pendingFuture = worker->pendingPromise->get_future().share();
    worker->cv.notify_all();
    return worker->pendingFuture;
}

TargetState PollingScheduler::state(std::string targetId) {
    std::shared_ptr<Worker> worker;
    {
        std::lock_guard<std::mutex> lock(_mtx);
        auto it = _workers.find(targetId);
        if (it == _workers.end()) {
            return TargetState::Cancelled;
        }
        worker = it->second;
    }
    std::lock_guard<std::mutex> lock(worker->mtx);
    return worker->state;
}

void PollingScheduler::signalStop(std::shared_ptr<Worker> worker) {
    std::lock_guard<std::mutex> lock(worker->mtx);
    worker->stopRequested = true;
    worker->cv.notify_all();
}

void PollingScheduler::awaitExit(std::shared_ptr<Worker> worker, std::chrono::milliseconds timeout) {
    if (!worker->thread.joinable()) {
        return;
    }
    if (worker->thread.get_id() == std::this_thread::get_id()) {
        // stopped from its own listener callback
        worker->thread.detach();
        return;
    }
    if (worker->exitedFuture.wait_for(timeout) == std::future_status::ready) {
        worker->thread.join();
    } else {
        _logger->warn("Polling target {} did not stop within {}ms, detaching it", worker->id, (long long)timeout.count());
        {
            // the listener may point into our owner, which can be gone by
            // the time the detached cycle finishes
            std::lock_guard<std::mutex> guard(worker->listenerMtx);
            worker->listenerDetached = true;
        }
        worker->thread.detach();
    }
}

void PollingScheduler::stop(std::string targetId) {
    std::shared_ptr<Worker> worker;
    {
        std::lock_guard<std::mutex> lock(_mtx);
        auto it = _workers.find(targetId);
        if (it == _workers.end()) {
            return;
        }
        worker = it->second;
        _workers.erase(it);
    }
    signalStop(worker);
    awaitExit(worker, _options.phaseTimeout);
    _logger->info("Stopped polling {}", targetId);
}

void PollingScheduler::stopAll() {
    std::map<std::string, std::shared_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(_mtx);
        workers.swap(_workers);
    }
    for (const auto & pair : workers) {
        signalStop(pair.second);
    }
    for (const auto & pair : workers) {
        awaitExit(pair.second, _options.phaseTimeout);
    }
}

#pragma mark Worker

static bool isStopping(std::mutex & mtx, bool & stopRequested) {
    std::lock_guard<std::mutex> lock(mtx);
    return stopRequested;
}

CycleResult PollingScheduler::runCycle(std::shared_ptr<Worker> worker, bool forced, SchedulerOptions options, std::shared_ptr<spdlog::logger> logger) {
    CycleResult result = emptyResult(worker->id, CycleStatus::Failed, forced);
    auto target = worker->target;

    auto setState = [&](TargetState state) {
        std::lock_guard<std::mutex> lock(worker->mtx);
        worker->state = state;
    };

    try {
        setState(TargetState::Fetching);
        int attempt = 0;
        while (true) {
            result.attempts = attempt + 1;
            try {
                target->fetch(forced);
                break;
            } catch (SyncException & ex) {
                logger->warn("[{}] fetch attempt {} failed: {}", worker->id, attempt + 1, ex.toJSON().dump());
                if (!ex.isRetryable() || attempt >= options.maxRetries) {
                    target->discard();
                    result.status = CycleStatus::FetchFailed;
                    result.error = ex.what();
                    return result;
                }
            }

            std::chrono::milliseconds delay = backoffDelay(options, attempt);
            logger->info("[{}] retrying in {}ms", worker->id, (long long)delay.count());
            std::unique_lock<std::mutex> lock(worker->mtx);
            worker->state = TargetState::Backoff;
            worker->cv.wait_for(lock, delay, [&]() { return worker->stopRequested; });
            if (worker->stopRequested) {
                target->discard();
                result.status = CycleStatus::Cancelled;
                return result;
            }
            worker->state = TargetState::Fetching;
            attempt++;
        }

        if (isStopping(worker->mtx, worker->stopRequested)) {
            target->discard();
            result.status = CycleStatus::Cancelled;
            return result;
        }

        setState(TargetState::Diffing);
        DiffOutcome outcome = target->detectChanges();
        result.changeCount = outcome.changeCount;

        if (isStopping(worker->mtx, worker->stopRequested)) {
            target->discard();
            result.status = CycleStatus::Cancelled;
            return result;
        }

        setState(TargetState::Dispatching);
        result.deliveries = target->dispatchAndCommit();

        if (outcome.firstObservation) {
            result.status = CycleStatus::Baseline;
        } else if (outcome.changeCount > 0) {
            result.status = CycleStatus::Changed;
        } else {
            result.status = CycleStatus::Unchanged;
        }
    } catch (std::exception & ex) {
        logger->error("[{}] cycle failed: {}", worker->id, ex.what());
        target->discard();
        result.status = CycleStatus::Failed;
        result.error = ex.what();
    }
    return result;
}

void PollingScheduler::run(std::shared_ptr<Worker> worker, SchedulerOptions options, std::shared_ptr<spdlog::logger> logger, CycleListener listener) {
    SetThreadName(worker->id.c_str());

    std::mt19937 rng{std::random_device{}()};
    bool first = worker->immediate;

    while (true) {
        std::shared_ptr<std::promise<CycleResult>> promise;
        bool forced = false;
        {
            std::unique_lock<std::mutex> lock(worker->mtx);
            if (!first) {
                long long jitter = worker->jitter.count();
                long long offset = jitter > 0 ? std::uniform_int_distribution<long long>(-jitter, jitter)(rng) : 0;
                std::chrono::milliseconds wait = std::max(std::chrono::milliseconds(0), worker->interval + std::chrono::milliseconds(offset));
                worker->cv.wait_until(lock, std::chrono::steady_clock::now() + wait, [&]() {
                    return worker->stopRequested || worker->pendingPromise != nullptr;
                });
            }
            first = false;
            if (worker->stopRequested) {
                break;
            }
            if (worker->pendingPromise) {
                promise = worker->pendingPromise;
                worker->currentFuture = worker->pendingFuture;
                worker->pendingPromise = nullptr;
                worker->pendingFuture = std::shared_future<CycleResult>();
                forced = true;
            } else {
                promise = std::make_shared<std::promise<CycleResult>>();
                worker->currentFuture = promise->get_future().share();
            }
            worker->cycleInFlight = true;
        }

        CycleResult result = runCycle(worker, forced, options, logger);

        {
            std::lock_guard<std::mutex> lock(worker->mtx);
            worker->cycleInFlight = false;
            worker->state = worker->stopRequested ? TargetState::Cancelled : TargetState::Idle;
        }
        promise->set_value(result);

        std::lock_guard<std::mutex> guard(worker->listenerMtx);
        if (!listener || worker->listenerDetached || isStopping(worker->mtx, worker->stopRequested)) {
            continue;
        }
        try {
            listener(result);
        } catch (std::exception & ex) {
            logger->error("[{}] cycle listener threw: {}", worker->id, ex.what());
        }
    }

    std::shared_ptr<std::promise<CycleResult>> pending;
    {
        std::lock_guard<std::mutex> lock(worker->mtx);
        worker->state = TargetState::Cancelled;
        pending = worker->pendingPromise;
        worker->pendingPromise = nullptr;
    }
    if (pending) {
        pending->set_value(emptyResult(worker->id, CycleStatus::Cancelled, true));
    }
    worker->exited.set_value();
}
