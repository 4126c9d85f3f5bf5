#include "capturepush/models/change_event.hpp"
#include "capturepush/generic_exception.hpp"

#include <set>

std::string ChangeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Added:
            return "added";
        case ChangeKind::Removed:
            return "removed";
        case ChangeKind::Modified:
            return "modified";
    }
    return "unknown";
}

ChangeEvent::ChangeEvent(ChangeKind kind, std::string identity, std::shared_ptr<Record> before, std::shared_ptr<Record> after) :
    kind(kind), identity(identity), before(before), after(after)
{
    if (before == nullptr && after == nullptr) {
        throw GenericException("ChangeEvent " + identity + " has neither a before nor an after record");
    }
}

std::shared_ptr<Record> ChangeEvent::subject() const {
    return after ? after : before;
}

std::vector<FieldChange> ChangeEvent::fieldChanges() const {
    std::vector<FieldChange> result;
    if (!before || !after) {
        return result;
    }
    nlohmann::json a = before->normalized();
    nlohmann::json b = after->normalized();

    // display fields first, in their declared order, then anything else
    std::vector<std::string> fields = after->fieldNames();
    std::set<std::string> seen(fields.begin(), fields.end());
    for (auto it = a.begin(); it != a.end(); ++it) {
        if (!seen.count(it.key())) { fields.push_back(it.key()); seen.insert(it.key()); }
    }
    for (auto it = b.begin(); it != b.end(); ++it) {
        if (!seen.count(it.key())) { fields.push_back(it.key()); seen.insert(it.key()); }
    }

    for (const auto & field : fields) {
        nlohmann::json va = a.count(field) ? a[field] : nlohmann::json(nullptr);
        nlohmann::json vb = b.count(field) ? b[field] : nlohmann::json(nullptr);
        if (va != vb) {
            result.push_back({field, before->textValue(field), after->textValue(field)});
        }
    }
    return result;
}

nlohmann::json ChangeEvent::toJSON() const {
    nlohmann::json fields = nlohmann::json::array();
    for (const auto & fc : fieldChanges()) {
        fields.push_back({{"field", fc.field}, {"before", fc.before}, {"after", fc.after}});
    }
    return {
        {"kind", ChangeKindToString(kind)},
        {"identity", identity},
        {"before", before ? before->toJSON() : nlohmann::json(nullptr)},
        {"after", after ? after->toJSON() : nlohmann::json(nullptr)},
        {"fields", fields},
    };
}
