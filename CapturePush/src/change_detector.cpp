#include "capturepush/change_detector.hpp"
#include "capturepush/generic_exception.hpp"

#include <set>

std::vector<ChangeEvent> ChangeDetector::diff(const std::shared_ptr<Snapshot> & previous, const std::shared_ptr<Snapshot> & current) {
    std::vector<ChangeEvent> added;
    std::vector<ChangeEvent> removed;
    std::vector<ChangeEvent> modified;

    if (previous == nullptr || current == nullptr) {
        return {};
    }
    if (previous->kind() != current->kind()) {
        throw GenericException("Cannot diff a " + previous->kind() + " snapshot against a " + current->kind() + " snapshot");
    }

    const auto & before = previous->recordsByIdentity();
    const auto & after = current->recordsByIdentity();

    // std::map iterates in identity order, which is the order we emit
    for (const auto & pair : after) {
        auto existing = before.find(pair.first);
        if (existing == before.end()) {
            added.push_back(ChangeEvent(ChangeKind::Added, pair.first, nullptr, pair.second));
        } else if (existing->second->normalized() != pair.second->normalized()) {
            modified.push_back(ChangeEvent(ChangeKind::Modified, pair.first, existing->second, pair.second));
        }
    }
    for (const auto & pair : before) {
        if (!after.count(pair.first)) {
            removed.push_back(ChangeEvent(ChangeKind::Removed, pair.first, pair.second, nullptr));
        }
    }

    std::vector<ChangeEvent> result;
    result.insert(result.end(), added.begin(), added.end());
    result.insert(result.end(), removed.begin(), removed.end());
    result.insert(result.end(), modified.begin(), modified.end());
    return result;
}

std::shared_ptr<Snapshot> ChangeDetector::apply(const std::shared_ptr<Snapshot> & previous, const std::vector<ChangeEvent> & changes) {
    std::set<std::string> removedIds;
    std::map<std::string, std::shared_ptr<Record>> replacements;
    std::vector<std::shared_ptr<Record>> appended;

    for (const auto & change : changes) {
        switch (change.kind) {
            case ChangeKind::Added:
                appended.push_back(change.after);
                break;
            case ChangeKind::Removed:
                removedIds.insert(change.identity);
                break;
            case ChangeKind::Modified:
                replacements[change.identity] = change.after;
                break;
        }
    }

    std::vector<std::shared_ptr<Record>> records;
    for (const auto & record : previous->records()) {
        std::string identity = record->identity();
        if (removedIds.count(identity)) {
            continue;
        }
        auto replacement = replacements.find(identity);
        records.push_back(replacement == replacements.end() ? record : replacement->second);
    }
    records.insert(records.end(), appended.begin(), appended.end());

    return std::make_shared<Snapshot>(previous->kind(), previous->accountKey(), records, previous->capturedAt());
}
