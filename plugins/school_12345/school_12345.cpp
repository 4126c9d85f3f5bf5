//
//  school_12345.cpp
//  CapturePush sample adapter
//
//  Reference implementation of the adapter ABI. It serves fixed records so
//  the CLI and the registry can be exercised without a real institution:
//
//    username "offline"  -> CAPTUREPUSH_ERROR_RETRYABLE
//    username "denied"   -> CAPTUREPUSH_ERROR_FATAL
//    CAPTUREPUSH_SAMPLE_SCORE overrides the score of the first course.
//

#include <stdlib.h>
#include <string.h>
#include <string>

#include "capturepush/adapter_abi.h"

static char * copyString(const std::string & value) {
    char * out = (char *)malloc(value.size() + 1);
    if (out != NULL) {
        memcpy(out, value.c_str(), value.size() + 1);
    }
    return out;
}

static int checkAccount(const char * username, char ** out_json) {
    std::string user = username ? username : "";
    if (user == "offline") {
        *out_json = copyString("institution unreachable");
        return CAPTUREPUSH_ERROR_RETRYABLE;
    }
    if (user == "denied" || user == "") {
        *out_json = copyString("invalid credentials");
        return CAPTUREPUSH_ERROR_FATAL;
    }
    return CAPTUREPUSH_OK;
}

extern "C" {

int capturepush_abi_version(void) {
    return CAPTUREPUSH_ADAPTER_ABI_VERSION;
}

const char* capturepush_school_name(void) {
    return "Sample Institute of Technology";
}

int capturepush_fetch_grades(const char* username, const char* password, int force_update, char** out_json) {
    int rc = checkAccount(username, out_json);
    if (rc != CAPTUREPUSH_OK) {
        return rc;
    }
    const char * score = getenv("CAPTUREPUSH_SAMPLE_SCORE");
    std::string json = std::string("[")
        + "{\"term\":\"2025-2026-1\",\"course_name\":\"Linear Algebra\",\"course_code\":\"MATH201\",\"score\":\"" + (score ? score : "90") + "\",\"credit\":\"4\",\"course_category\":\"Required\"},"
        + "{\"term\":\"2025-2026-1\",\"course_name\":\"Operating Systems\",\"course_code\":\"CS310\",\"score\":\"88\",\"credit\":\"3\",\"course_category\":\"Required\"}"
        + "]";
    *out_json = copyString(json);
    return CAPTUREPUSH_OK;
}

int capturepush_fetch_course_schedule(const char* username, const char* password, int force_update, char** out_json) {
    int rc = checkAccount(username, out_json);
    if (rc != CAPTUREPUSH_OK) {
        return rc;
    }
    std::string json = std::string("[")
        + "{\"weekday\":1,\"start_period\":1,\"end_period\":2,\"course_name\":\"Linear Algebra\",\"teacher\":\"Dr. Wang\",\"room\":\"A-101\",\"week_list\":\"all\"},"
        + "{\"weekday\":3,\"start_period\":5,\"end_period\":6,\"course_name\":\"Operating Systems\",\"teacher\":\"Dr. Li\",\"room\":\"B-204\",\"week_list\":[1,2,3,4,5,6,7,8]}"
        + "]";
    *out_json = copyString(json);
    return CAPTUREPUSH_OK;
}

void capturepush_free(char* ptr) {
    free(ptr);
}

}
