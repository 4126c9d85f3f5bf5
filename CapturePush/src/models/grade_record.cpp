#include "capturepush/models/grade_record.hpp"
#include "capturepush/generic_exception.hpp"

GradeRecord::GradeRecord(nlohmann::json json) :
    Record(json)
{
    if (courseName() == "") {
        throw GenericException("Grade record has no course_name: " + _data.dump());
    }
}

std::string GradeRecord::kind() {
    return RECORD_KIND_GRADES;
}

std::string GradeRecord::identity() {
    std::string code = courseCode();
    return term() + "\x1f" + courseName() + "\x1f" + (code != "" ? code : courseName());
}

std::string GradeRecord::displayName() {
    if (term() == "") {
        return courseName();
    }
    return courseName() + " (" + term() + ")";
}

std::vector<std::string> GradeRecord::fieldNames() {
    return {"score", "credit", "course_category", "term", "course_code"};
}

std::string GradeRecord::term() {
    return textValue("term");
}

std::string GradeRecord::courseName() {
    return textValue("course_name");
}

std::string GradeRecord::courseCode() {
    return textValue("course_code");
}

std::string GradeRecord::score() {
    return textValue("score");
}
