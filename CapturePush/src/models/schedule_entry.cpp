#include "capturepush/models/schedule_entry.hpp"
#include "capturepush/capture_utils.hpp"
#include "capturepush/generic_exception.hpp"

#include <algorithm>
#include <stdlib.h>

static bool parseWeek(const nlohmann::json & value, int & week) {
    if (value.is_number_integer()) {
        week = value.get<int>();
        return week >= 1;
    }
    if (!value.is_string()) {
        return false;
    }
    std::string str = CaptureUtils::normalizeWhitespace(value.get<std::string>());
    char * end = nullptr;
    long parsed = strtol(str.c_str(), &end, 10);
    if (str == "" || end == nullptr || *end != '\0' || parsed < 1 || parsed > 1000) {
        return false;
    }
    week = (int)parsed;
    return true;
}

ScheduleEntry::ScheduleEntry(nlohmann::json json) :
    Record(json)
{
    int day = intValue("weekday", 0);
    if (day < 1 || day > 7) {
        throw GenericException("Schedule entry has invalid weekday: " + _data.dump());
    }
    if (intValue("start_period", -1) < 0) {
        throw GenericException("Schedule entry has no start_period: " + _data.dump());
    }
    if (courseName() == "") {
        throw GenericException("Schedule entry has no course_name: " + _data.dump());
    }
    if (_data.count("week_list") && !_data["week_list"].is_null() && !allWeeks()) {
        const nlohmann::json & list = _data["week_list"];
        if (!list.is_array()) {
            throw GenericException("Schedule entry week_list must be \"all\" or an array of weeks: " + _data.dump());
        }
        for (const auto & w : list) {
            int week = 0;
            if (!parseWeek(w, week)) {
                throw GenericException("Schedule entry week_list has an invalid week: " + _data.dump());
            }
        }
    }
}

std::string ScheduleEntry::kind() {
    return RECORD_KIND_SCHEDULE;
}

std::string ScheduleEntry::identity() {
    // zero padded so that identities sort by day and period
    char prefix[32];
    snprintf(prefix, sizeof(prefix), "%d|%03d|", weekday(), startPeriod());
    return std::string(prefix) + courseName();
}

std::string ScheduleEntry::displayName() {
    return courseName() + " (day " + std::to_string(weekday()) + ", period " + std::to_string(startPeriod()) + ")";
}

std::vector<std::string> ScheduleEntry::fieldNames() {
    return {"room", "teacher", "end_period", "week_list"};
}

nlohmann::json ScheduleEntry::normalizedValue(const std::string & field) {
    if (field != "week_list") {
        return Record::normalizedValue(field);
    }
    if (!_data.count("week_list") || _data["week_list"].is_null()) {
        return nullptr;
    }
    if (allWeeks()) {
        return WEEK_LIST_ALL;
    }
    nlohmann::json result = nlohmann::json::array();
    for (int week : weeks()) {
        result.push_back(week);
    }
    return result;
}

int ScheduleEntry::intValue(const std::string & field, int fallback) {
    if (!_data.count(field)) {
        return fallback;
    }
    const nlohmann::json & value = _data[field];
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        std::string str = CaptureUtils::normalizeWhitespace(value.get<std::string>());
        char * end = nullptr;
        long parsed = strtol(str.c_str(), &end, 10);
        if (str != "" && end != nullptr && *end == '\0') {
            return (int)parsed;
        }
    }
    return fallback;
}

int ScheduleEntry::weekday() {
    return intValue("weekday", 0);
}

int ScheduleEntry::startPeriod() {
    return intValue("start_period", 0);
}

int ScheduleEntry::endPeriod() {
    return intValue("end_period", startPeriod());
}

std::string ScheduleEntry::courseName() {
    return textValue("course_name");
}

std::string ScheduleEntry::room() {
    return textValue("room");
}

std::string ScheduleEntry::teacher() {
    return textValue("teacher");
}

bool ScheduleEntry::allWeeks() {
    if (!_data.count("week_list") || !_data["week_list"].is_string()) {
        return false;
    }
    return CaptureUtils::toLower(CaptureUtils::normalizeWhitespace(_data["week_list"].get<std::string>())) == WEEK_LIST_ALL;
}

std::vector<int> ScheduleEntry::weeks() {
    std::vector<int> result;
    if (!_data.count("week_list") || !_data["week_list"].is_array()) {
        return result;
    }
    for (const auto & w : _data["week_list"]) {
        int week = 0;
        if (parseWeek(w, week)) {
            result.push_back(week);
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}
