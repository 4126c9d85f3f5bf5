#include "capturepush/thread_utils.hpp"
#include <spdlog/details/os.h>
#include <stdio.h>
#include <map>
#include <mutex>

#include <pthread.h>

static std::map<size_t, std::string> names{};
static std::mutex namesMtx;

void SetThreadName(const char* threadName)
{
    {
        std::lock_guard<std::mutex> lck(namesMtx);
        names[spdlog::details::os::thread_id()] = threadName;
    }

    // the kernel limits thread names to 15 characters + NUL
    char truncated[16];
    snprintf(truncated, sizeof(truncated), "%s", threadName);
#ifdef __APPLE__
    pthread_setname_np(truncated);
#else
    pthread_setname_np(pthread_self(), truncated);
#endif
}

std::string GetThreadName(size_t spdlog_thread_id) {
    std::lock_guard<std::mutex> lck(namesMtx);
    auto it = names.find(spdlog_thread_id);
    if (it == names.end()) {
        return std::to_string(spdlog_thread_id);
    }
    return it->second;
}
