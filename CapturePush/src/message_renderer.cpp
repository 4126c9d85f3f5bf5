#include "capturepush/message_renderer.hpp"
#include "capturepush/models/record.hpp"

static std::string kindTitle(const std::string & kind) {
    if (kind == RECORD_KIND_GRADES) {
        return "Grades";
    }
    if (kind == RECORD_KIND_SCHEDULE) {
        return "Course schedule";
    }
    return kind;
}

static std::string fieldSummary(const std::shared_ptr<Record> & record) {
    std::string result;
    for (const auto & field : record->fieldNames()) {
        std::string value = record->textValue(field);
        if (value == "") {
            continue;
        }
        if (result != "") {
            result += ", ";
        }
        result += field + " " + value;
    }
    return result;
}

std::string MessageRenderer::subject(std::string kind, const std::vector<ChangeEvent> & changes) {
    int added = 0, removed = 0, modified = 0;
    for (const auto & change : changes) {
        if (change.kind == ChangeKind::Added) added++;
        if (change.kind == ChangeKind::Removed) removed++;
        if (change.kind == ChangeKind::Modified) modified++;
    }

    std::string counts;
    if (added) counts += std::to_string(added) + " added";
    if (removed) counts += std::string(counts == "" ? "" : ", ") + std::to_string(removed) + " removed";
    if (modified) counts += std::string(counts == "" ? "" : ", ") + std::to_string(modified) + " modified";
    if (counts == "") counts = "no changes";

    return kindTitle(kind) + " updated: " + counts;
}

std::string MessageRenderer::describe(const ChangeEvent & change) {
    std::shared_ptr<Record> record = change.subject();
    std::string line;

    switch (change.kind) {
        case ChangeKind::Added: {
            line = "[+] " + record->displayName();
            std::string summary = fieldSummary(record);
            if (summary != "") {
                line += ": " + summary;
            }
            break;
        }
        case ChangeKind::Removed:
            line = "[-] " + record->displayName();
            break;
        case ChangeKind::Modified: {
            line = "[*] " + record->displayName() + ":";
            bool first = true;
            for (const auto & fc : change.fieldChanges()) {
                line += std::string(first ? " " : "; ") + fc.field + " " +
                    (fc.before == "" ? "(none)" : fc.before) + " -> " +
                    (fc.after == "" ? "(none)" : fc.after);
                first = false;
            }
            break;
        }
    }
    return line;
}

std::string MessageRenderer::content(std::string kind, const std::vector<ChangeEvent> & changes) {
    std::string body = subject(kind, changes) + "\n";
    for (const auto & change : changes) {
        body += "\n" + describe(change);
    }
    return body;
}
