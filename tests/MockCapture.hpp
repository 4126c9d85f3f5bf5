#ifndef MOCKCAPTURE_HPP
#define MOCKCAPTURE_HPP

#include <gmock/gmock.h>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <stdlib.h>
#include <unistd.h>

#include "capturepush/notification_channel.hpp"
#include "capturepush/plugin_transport.hpp"
#include "capturepush/school_adapter.hpp"
#include "capturepush/sync_exception.hpp"

class MockSchoolAdapter : public SchoolAdapter {
public:
    MockSchoolAdapter(std::string code = "10001") :
        _code(code) {}

    MOCK_METHOD(std::string, schoolName, (), (override));

    MOCK_METHOD(RecordList, fetchGrades, (const Credentials & credentials, bool forceUpdate), (override));

    MOCK_METHOD(RecordList, fetchCourseSchedule, (const Credentials & credentials, bool forceUpdate), (override));

    std::string schoolCode() override { return _code; }

private:
    std::string _code;
};

class MockNotificationChannel : public NotificationChannel {
public:
    MOCK_METHOD(bool, send, (std::string subject, std::string content), (override));
};

// Serves canned bodies by URL; unknown URLs fail like an unreachable host.
class FakePluginTransport : public PluginTransport {
public:
    FakePluginTransport() :
        _downloads(0) {}

    std::string download(std::string url) override {
        std::lock_guard<std::mutex> lock(_mtx);
        _downloads++;
        auto it = _bodies.find(url);
        if (it == _bodies.end()) {
            throw SyncException(CURLE_COULDNT_CONNECT, url);
        }
        return it->second;
    }

    void setBody(const std::string & url, const std::string & body) {
        std::lock_guard<std::mutex> lock(_mtx);
        _bodies[url] = body;
    }

    void removeBody(const std::string & url) {
        std::lock_guard<std::mutex> lock(_mtx);
        _bodies.erase(url);
    }

    int downloads() {
        std::lock_guard<std::mutex> lock(_mtx);
        return _downloads;
    }

private:
    std::mutex _mtx;
    std::map<std::string, std::string> _bodies;
    int _downloads;
};

inline RecordList MakeRecordList(std::vector<nlohmann::json> items) {
    return std::make_shared<std::vector<nlohmann::json>>(items);
}

inline nlohmann::json MakeGrade(std::string course, std::string score, std::string term = "2025-2026-1") {
    return {
        {"term", term},
        {"course_name", course},
        {"score", score},
        {"credit", "3"},
    };
}

inline std::string MakeTestDir(std::string name) {
    static std::atomic<int> counter { 0 };
    std::string path = "/tmp/capturepush_test_" + name + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++);
    system(("rm -rf " + path + " && mkdir -p " + path).c_str());
    return path;
}

inline void RemoveTestDir(std::string path) {
    system(("rm -rf " + path).c_str());
}

#endif // MOCKCAPTURE_HPP
