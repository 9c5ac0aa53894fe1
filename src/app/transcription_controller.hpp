// Copyright (c) 2025 Transcriber
// Application API - Transcription Controller Interface
//
// Runs one transcription job at a time on a background thread and reports
// log lines, progress, the chosen compute backend and the terminal state.
// Bridges the pipeline and the GUI.

#pragma once

#include <functional>
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

#include "app/transcription_pipeline.hpp"

namespace app {

// Forward declarations
class TranscriptionControllerImpl;

//==============================================================================
// Event Structures
//==============================================================================

/// Job progress in items (videos) processed
struct JobProgress {
    int current;                                  ///< Items finished
    int total;                                    ///< Items in the job

    /// 0-100; 0 when total is unknown
    int percent() const {
        if (total <= 0) return 0;
        return static_cast<int>((static_cast<int64_t>(current) * 100) / total);
    }
};

/// Controller status information
struct ControllerStatus {
    /// Current state of the controller
    enum class State {
        IDLE,                                     ///< No job
        RUNNING,                                  ///< Job in progress
        CANCELLING                                ///< Cancel requested, job still winding down
    };

    State state;                                  ///< Current state
    std::string url;                              ///< URL of the current or last job
    std::string backend;                          ///< Compute backend of the current or last job
    JobProgress progress;                         ///< Last progress reported
};

//==============================================================================
// Callback Types
//==============================================================================

using LogCallback = std::function<void(const std::string&)>;
using ProgressCallback = std::function<void(const JobProgress&)>;
using BackendCallback = std::function<void(const std::string&)>;
using FinishedCallback = std::function<void(const JobResult&)>;

//==============================================================================
// Main Controller Class
//==============================================================================

/// Main controller for background transcription jobs
///
/// Thread Safety:
/// - All public methods are thread-safe
/// - Callbacks are invoked from the worker thread
/// - GUI applications should marshal callbacks to UI thread
/// - Do not call start() or wait() from inside a callback
///
/// Example:
/// @code
/// TranscriptionController controller;
///
/// controller.subscribe_to_log([](const std::string& line) {
///     std::cout << line << "\n";
/// });
///
/// JobRequest request;
/// request.url = "https://www.youtube.com/watch?v=...";
/// controller.start(request);
/// controller.wait();
/// @endcode
class TranscriptionController {
public:
    /// Construct with the production services (yt-dlp, ffmpeg, whisper.cpp)
    TranscriptionController();

    /// Construct with custom services
    explicit TranscriptionController(PipelineServices services);

    /// Destructor (cancels and joins a running job)
    ~TranscriptionController();

    // Non-copyable, non-movable
    TranscriptionController(const TranscriptionController&) = delete;
    TranscriptionController& operator=(const TranscriptionController&) = delete;
    TranscriptionController(TranscriptionController&&) = delete;
    TranscriptionController& operator=(TranscriptionController&&) = delete;

    //==========================================================================
    // Job Control
    //==========================================================================

    /// Start a job on the worker thread
    /// @return false if a job is already running
    bool start(const JobRequest& request);

    /// Request cooperative cancellation
    /// @note Checked between download and inference, between items and
    ///       inside inference. Safe to call when idle.
    void cancel();

    /// Block until the current job (if any) has finished
    void wait();

    bool is_running() const;

    ControllerStatus get_status() const;

    //==========================================================================
    // Event Subscription
    //==========================================================================

    void subscribe_to_log(LogCallback callback);
    void subscribe_to_progress(ProgressCallback callback);
    void subscribe_to_backend(BackendCallback callback);

    /// Exactly one finished event per started job
    void subscribe_to_finished(FinishedCallback callback);

    /// Clear all event subscriptions
    void clear_subscriptions();

private:
    std::unique_ptr<TranscriptionControllerImpl> impl_;  ///< PIMPL implementation
};

} // namespace app
