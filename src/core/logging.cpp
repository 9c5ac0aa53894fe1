#include "core/logging.hpp"
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace core {
namespace {
std::mutex g_log_mutex;
}

bool debug_enabled() {
    static const bool enabled = std::getenv("TRANSCRIBER_DEBUG") != nullptr;
    return enabled;
}

void log_info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[INFO] " << msg << std::endl;
}

void log_warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[WARN] " << msg << std::endl;
}

void log_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[ERROR] " << msg << std::endl;
}

void log_debug(const std::string& msg) {
    if (!debug_enabled()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[DEBUG] " << msg << std::endl;
}
}
