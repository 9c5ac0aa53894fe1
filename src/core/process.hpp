#pragma once
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <QJsonObject>

#include "core/logging.hpp"

namespace core {

class ProcessError : public std::runtime_error {
public:
    ProcessError(const std::string& message, int exit_code)
        : std::runtime_error(message), exit_code_(exit_code) {}
    int exit_code() const { return exit_code_; }
private:
    int exit_code_;
};

// Thrown by run_command() when the cancel check stopped the program.
class ProcessCancelled : public ProcessError {
public:
    explicit ProcessCancelled(const std::string& program)
        : ProcessError(program + " cancelled", -1) {}
};

struct CommandResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

using LineCallback = std::function<void(const std::string& line)>;
using CancelCheck = std::function<bool()>;

/// Run an external program and wait for it.
/// @param on_line Receives each stdout line as it arrives (optional)
/// @param check   Throw ProcessError on non-zero exit
/// @param cancelled Polled while the program runs; true kills it
/// @throws ProcessCancelled if the cancel check fired
/// @throws ProcessError if the program cannot be started, crashes, or
///         (with check) exits non-zero. The message is the trimmed stderr,
///         else the trimmed stdout, else "Command failed".
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          const LogFn& log,
                          const LineCallback& on_line = {},
                          bool check = true,
                          const CancelCheck& cancelled = {});

/// Run a program whose stdout is a single JSON object.
QJsonObject run_json(const std::string& program,
                     const std::vector<std::string>& args,
                     const LogFn& log,
                     const CancelCheck& cancelled = {});

std::string format_command(const std::string& program, const std::vector<std::string>& args);

}
