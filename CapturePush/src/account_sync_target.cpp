#include "capturepush/account_sync_target.hpp"
#include "capturepush/change_detector.hpp"
#include "capturepush/message_renderer.hpp"
#include "capturepush/sync_exception.hpp"

AccountSyncTarget::AccountSyncTarget(AccountConfig account, std::string kind, std::shared_ptr<SchoolAdapter> adapter, std::shared_ptr<StateStore> store, std::shared_ptr<NotificationDispatcher> dispatcher, std::shared_ptr<spdlog::logger> logger) :
    _account(account), _kind(kind), _adapter(adapter), _store(store), _dispatcher(dispatcher), _logger(logger)
{
}

std::string AccountSyncTarget::targetId() {
    return _account.accountKey() + "/" + _kind;
}

std::string AccountSyncTarget::kind() {
    return _kind;
}

void AccountSyncTarget::fetch(bool forceUpdate) {
    discard();

    Credentials credentials{_account.username, _account.password};
    RecordList records = (_kind == RECORD_KIND_GRADES)
        ? _adapter->fetchGrades(credentials, forceUpdate)
        : _adapter->fetchCourseSchedule(credentials, forceUpdate);

    if (records == nullptr) {
        throw SyncException("no-result", _adapter->schoolCode() + " returned no " + _kind + " for " + _account.accountKey(), true);
    }

    try {
        _fetched = Snapshot::FromJSON(_kind, _account.accountKey(), nlohmann::json(*records), time(0), _logger);
    } catch (GenericException & ex) {
        throw SyncException("invalid-records", ex.what(), false);
    }
    _logger->info("[{}] fetched {} record(s)", targetId(), _fetched->size());
}

DiffOutcome AccountSyncTarget::detectChanges() {
    _previous = _store->load(_account.accountKey(), _kind);
    _changes = ChangeDetector::diff(_previous, _fetched);

    if (_previous == nullptr) {
        _logger->info("[{}] first observation, storing {} record(s) without notifying", targetId(), _fetched->size());
    } else {
        _logger->info("[{}] {} change(s) detected", targetId(), _changes.size());
    }
    return DiffOutcome{_previous == nullptr, _changes.size()};
}

std::map<std::string, bool> AccountSyncTarget::dispatchAndCommit() {
    std::map<std::string, bool> deliveries;

    if (!_changes.empty()) {
        std::string subject = MessageRenderer::subject(_kind, _changes);
        std::string content = MessageRenderer::content(_kind, _changes);
        deliveries = _dispatcher->dispatch(subject, content);
        for (const auto & pair : deliveries) {
            if (!pair.second) {
                _logger->warn("[{}] notification through {} failed", targetId(), pair.first);
            }
        }
    }

    // committed after the dispatch attempt, whatever its outcome
    _store->save(*_fetched);
    discard();
    return deliveries;
}

void AccountSyncTarget::discard() {
    _fetched = nullptr;
    _previous = nullptr;
    _changes.clear();
}
