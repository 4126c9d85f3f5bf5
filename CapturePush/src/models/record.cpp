#include "capturepush/models/record.hpp"
#include "capturepush/models/grade_record.hpp"
#include "capturepush/models/schedule_entry.hpp"
#include "capturepush/capture_utils.hpp"
#include "capturepush/generic_exception.hpp"

Record::Record(nlohmann::json json) :
    _data(json)
{
    if (!_data.is_object()) {
        throw GenericException("Record must be a JSON object, got: " + _data.dump());
    }
}

Record::~Record() {
}

nlohmann::json Record::normalizedValue(const std::string & field) {
    if (!_data.count(field)) {
        return nullptr;
    }
    const nlohmann::json & value = _data[field];
    if (value.is_string()) {
        return CaptureUtils::normalizeWhitespace(value.get<std::string>());
    }
    if (value.is_number()) {
        return value.dump();
    }
    return value;
}

nlohmann::json Record::normalized() {
    nlohmann::json result = nlohmann::json::object();
    for (auto it = _data.begin(); it != _data.end(); ++it) {
        result[it.key()] = normalizedValue(it.key());
    }
    return result;
}

std::string Record::textValue(const std::string & field) {
    if (!_data.count(field) || _data[field].is_null()) {
        return "";
    }
    const nlohmann::json & value = _data[field];
    if (value.is_string()) {
        return CaptureUtils::normalizeWhitespace(value.get<std::string>());
    }
    return value.dump();
}

nlohmann::json Record::toJSON() {
    return _data;
}

std::shared_ptr<Record> RecordFromJSON(std::string kind, const nlohmann::json & json) {
    if (kind == RECORD_KIND_GRADES) {
        return std::make_shared<GradeRecord>(json);
    }
    if (kind == RECORD_KIND_SCHEDULE) {
        return std::make_shared<ScheduleEntry>(json);
    }
    throw GenericException("Unknown record kind: " + kind);
}
