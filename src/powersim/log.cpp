#include "powersim/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

namespace powersim {
namespace {

std::atomic<bool> gQuiet{false};
std::mutex gLogMutex;

void emit(const char* level, const std::string& message) {
    std::ostringstream oss;
    oss << "[powersim] " << level << ": " << message << '\n';
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::cerr << oss.str();
    std::cerr.flush();
}

}  // namespace

void setLogQuiet(bool quiet) { gQuiet.store(quiet); }

void logInfo(const std::string& message) {
    if (gQuiet.load()) {
        return;
    }
    emit("info", message);
}

void logWarning(const std::string& message) { emit("warning", message); }

void logError(const std::string& message) { emit("error", message); }

}  // namespace powersim
