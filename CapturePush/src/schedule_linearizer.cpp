#include "capturepush/schedule_linearizer.hpp"
#include "capturepush/capture_utils.hpp"
#include "capturepush/generic_exception.hpp"
#include "capturepush/models/schedule_entry.hpp"

#include <algorithm>
#include <map>
#include <vector>

struct WeekSlot {
    int weekday;
    int startPeriod;
    int endPeriod;
    std::string courseName;
    std::string teacher;
    std::string room;
};

ScheduleLinearizer::ScheduleLinearizer(int semesterWeeks, std::string firstMonday) :
    _semesterWeeks(semesterWeeks), _firstMonday(firstMonday), _firstMondayTime(0)
{
    if (_firstMonday != "" && !CaptureUtils::parseISODate(_firstMonday, _firstMondayTime)) {
        throw GenericException("Invalid first Monday date: " + _firstMonday);
    }
}

std::string ScheduleLinearizer::dateFor(int week, int weekday) {
    if (_firstMonday == "") {
        return "";
    }
    time_t day = _firstMondayTime + (time_t)((week - 1) * 7 + (weekday - 1)) * 24 * 60 * 60;
    return CaptureUtils::formatISODate(day);
}

nlohmann::json ScheduleLinearizer::linearize(const Snapshot & schedule, time_t generatedAt) {
    std::map<int, std::vector<WeekSlot>> weeks;

    for (const auto & record : schedule.records()) {
        auto entry = std::dynamic_pointer_cast<ScheduleEntry>(record);
        if (!entry) {
            continue;
        }
        WeekSlot slot{entry->weekday(), entry->startPeriod(), entry->endPeriod(), entry->courseName(), entry->teacher(), entry->room()};

        std::vector<int> entryWeeks = entry->weeks();
        if (entry->allWeeks()) {
            entryWeeks.clear();
            for (int w = 1; w <= _semesterWeeks; w++) {
                entryWeeks.push_back(w);
            }
        }
        for (int w : entryWeeks) {
            weeks[w].push_back(slot);
        }
    }

    nlohmann::json data = nlohmann::json::object();

    for (auto & pair : weeks) {
        int week = pair.first;
        std::vector<WeekSlot> & slots = pair.second;
        std::sort(slots.begin(), slots.end(), [](const WeekSlot & a, const WeekSlot & b) {
            if (a.weekday != b.weekday) return a.weekday < b.weekday;
            if (a.courseName != b.courseName) return a.courseName < b.courseName;
            return a.startPeriod < b.startPeriod;
        });

        std::vector<WeekSlot> merged;
        for (const auto & slot : slots) {
            if (!merged.empty()) {
                WeekSlot & last = merged.back();
                if (last.weekday == slot.weekday && last.courseName == slot.courseName && slot.startPeriod == last.endPeriod + 1) {
                    last.endPeriod = slot.endPeriod;
                    continue;
                }
            }
            merged.push_back(slot);
        }

        nlohmann::json courses = nlohmann::json::array();
        for (const auto & slot : merged) {
            nlohmann::json course = {
                {"weekday", slot.weekday},
                {"start_period", slot.startPeriod},
                {"end_period", slot.endPeriod},
                {"course_name", slot.courseName},
                {"teacher", slot.teacher},
                {"room", slot.room},
                {"week", week},
            };
            std::string date = dateFor(week, slot.weekday);
            if (date != "") {
                course["date"] = date;
            }
            courses.push_back(course);
        }

        data["week " + std::to_string(week)] = {
            {"week", week},
            {"course_count", merged.size()},
            {"courses", courses},
        };
    }

    nlohmann::json metadata = {
        {"generated_at", CaptureUtils::localTimestampForTime(generatedAt)},
        {"total_courses", schedule.size()},
        {"weeks", weeks.size()},
        {"format", "linear-weeks"},
    };
    if (_firstMonday != "") {
        metadata["first_monday"] = _firstMonday;
    }
    return {{"metadata", metadata}, {"data", data}};
}
