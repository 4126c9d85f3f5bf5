#include "capturepush/models/snapshot.hpp"
#include "capturepush/generic_exception.hpp"

Snapshot::Snapshot(std::string kind, std::string accountKey, std::vector<std::shared_ptr<Record>> records, time_t capturedAt, std::shared_ptr<spdlog::logger> logger) :
    _kind(kind), _accountKey(accountKey), _capturedAt(capturedAt), _duplicates(0)
{
    for (const auto & record : records) {
        std::string identity = record->identity();
        if (_byIdentity.count(identity)) {
            _duplicates += 1;
            if (logger) {
                logger->warn("Snapshot {} / {}: dropping duplicate record {}", accountKey, kind, record->displayName());
            }
            continue;
        }
        _byIdentity[identity] = record;
        _records.push_back(record);
    }
}

std::shared_ptr<Snapshot> Snapshot::FromJSON(std::string kind, std::string accountKey, const nlohmann::json & records, time_t capturedAt, std::shared_ptr<spdlog::logger> logger) {
    if (!records.is_array()) {
        throw GenericException("Expected an array of " + kind + " records, got: " + records.dump().substr(0, 200));
    }
    std::vector<std::shared_ptr<Record>> parsed;
    for (const auto & item : records) {
        parsed.push_back(RecordFromJSON(kind, item));
    }
    return std::make_shared<Snapshot>(kind, accountKey, parsed, capturedAt, logger);
}

std::string Snapshot::kind() const {
    return _kind;
}

std::string Snapshot::accountKey() const {
    return _accountKey;
}

time_t Snapshot::capturedAt() const {
    return _capturedAt;
}

int Snapshot::duplicatesDropped() const {
    return _duplicates;
}

const std::vector<std::shared_ptr<Record>> & Snapshot::records() const {
    return _records;
}

const std::map<std::string, std::shared_ptr<Record>> & Snapshot::recordsByIdentity() const {
    return _byIdentity;
}

std::shared_ptr<Record> Snapshot::find(const std::string & identity) const {
    auto it = _byIdentity.find(identity);
    if (it == _byIdentity.end()) {
        return nullptr;
    }
    return it->second;
}

size_t Snapshot::size() const {
    return _records.size();
}

nlohmann::json Snapshot::recordsJSON() const {
    nlohmann::json result = nlohmann::json::array();
    for (const auto & record : _records) {
        result.push_back(record->toJSON());
    }
    return result;
}

nlohmann::json Snapshot::toJSON() const {
    return {
        {"kind", _kind},
        {"accountKey", _accountKey},
        {"capturedAt", (long long)_capturedAt},
        {"records", recordsJSON()},
    };
}
