#pragma once
#include <functional>
#include <string>

namespace core {
// Receives user-facing progress messages for the current job.
using LogFn = std::function<void(const std::string&)>;

void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);
// Only printed when TRANSCRIBER_DEBUG is set.
void log_debug(const std::string& msg);
bool debug_enabled();
}
