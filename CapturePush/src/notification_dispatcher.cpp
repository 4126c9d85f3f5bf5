#include "capturepush/notification_dispatcher.hpp"
#include "capturepush/plugin_exception.hpp"
#include "capturepush/thread_utils.hpp"

#include <future>
#include <thread>

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<spdlog::logger> logger, std::chrono::milliseconds timeout) :
    _timeout(timeout), _logger(logger)
{
}

void NotificationDispatcher::registerChannel(std::string name, std::shared_ptr<NotificationChannel> channel, bool enabled) {
    if (channel == nullptr) {
        throw LoadException(name, "notification channel is null");
    }
    std::lock_guard<std::mutex> lock(_mtx);
    if (_channels.count(name)) {
        _logger->info("Replacing notification channel {}", name);
    }
    _channels[name] = Registration{channel, enabled, std::make_shared<std::atomic<int>>(0)};
}

bool NotificationDispatcher::setEnabled(std::string name, bool enabled) {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _channels.find(name);
    if (it == _channels.end()) {
        return false;
    }
    it->second.enabled = enabled;
    return true;
}

bool NotificationDispatcher::isEnabled(std::string name) {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _channels.find(name);
    return it != _channels.end() && it->second.enabled;
}

std::vector<std::string> NotificationDispatcher::channelNames() {
    std::lock_guard<std::mutex> lock(_mtx);
    std::vector<std::string> names;
    for (const auto & pair : _channels) {
        names.push_back(pair.first);
    }
    return names;
}

std::map<std::string, bool> NotificationDispatcher::dispatch(std::string subject, std::string content) {
    std::map<std::string, Registration> targets;
    {
        std::lock_guard<std::mutex> lock(_mtx);
        for (const auto & pair : _channels) {
            if (pair.second.enabled) {
                targets[pair.first] = pair.second;
            }
        }
    }

    enum SendState { Running, Finished, Abandoned };

    struct PendingSend {
        std::future<bool> future;
        std::shared_ptr<std::atomic<int>> state;
        std::shared_ptr<std::atomic<int>> abandoned;
    };

    std::map<std::string, PendingSend> pending;
    std::map<std::string, bool> results;
    auto logger = _logger;

    for (const auto & pair : targets) {
        std::string name = pair.first;
        std::shared_ptr<NotificationChannel> channel = pair.second.channel;
        std::shared_ptr<std::atomic<int>> abandoned = pair.second.abandoned;

        int stuck = abandoned->load();
        if (stuck > 0) {
            _logger->warn("Channel {} still has {} timed out send(s) outstanding, recording failure", name, stuck);
            results[name] = false;
            continue;
        }

        auto promise = std::make_shared<std::promise<bool>>();
        auto state = std::make_shared<std::atomic<int>>(Running);
        pending[name] = PendingSend{promise->get_future(), state, abandoned};

        // Detached: a channel that hangs past the timeout keeps its own
        // references alive and finishes in the background.
        std::thread([promise, name, channel, state, abandoned, subject, content, logger]() {
            SetThreadName(("notify-" + name).c_str());
            bool ok = false;
            try {
                ok = channel->send(subject, content);
            } catch (std::exception & ex) {
                logger->error("Channel {} threw while sending: {}", name, ex.what());
            } catch (...) {
                logger->error("Channel {} threw a non-standard exception while sending", name);
            }
            if (state->exchange(Finished) == Abandoned) {
                abandoned->fetch_sub(1);
                logger->info("Channel {} returned from a timed out send", name);
            }
            promise->set_value(ok);
        }).detach();
    }

    auto deadline = std::chrono::steady_clock::now() + _timeout;

    for (auto & pair : pending) {
        PendingSend & send = pair.second;
        if (send.future.wait_until(deadline) != std::future_status::ready) {
            int running = Running;
            if (send.state->compare_exchange_strong(running, Abandoned)) {
                send.abandoned->fetch_add(1);
            }
            _logger->warn("Channel {} did not finish within {}ms, recording failure", pair.first, (long long)_timeout.count());
            results[pair.first] = false;
            continue;
        }
        results[pair.first] = send.future.get();
        if (!results[pair.first]) {
            _logger->warn("Channel {} failed to deliver \"{}\"", pair.first, subject);
        }
    }
    return results;
}
