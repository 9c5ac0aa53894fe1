// Copyright (c) 2025 Transcriber
// Application API - Transcription Controller Implementation

#include "app/transcription_controller.hpp"
#include "core/logging.hpp"

#include <mutex>
#include <atomic>
#include <thread>

namespace app {

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class TranscriptionControllerImpl {
public:
    explicit TranscriptionControllerImpl(PipelineServices services)
        : services_(std::move(services)) {}
    ~TranscriptionControllerImpl() {
        cancel();
        wait();
    }

    // Job Control
    bool start(const JobRequest& request);
    void cancel();
    void wait();
    bool is_running() const;
    ControllerStatus get_status() const;

    // Event Subscription
    void subscribe_to_log(LogCallback callback);
    void subscribe_to_progress(ProgressCallback callback);
    void subscribe_to_backend(BackendCallback callback);
    void subscribe_to_finished(FinishedCallback callback);
    void clear_subscriptions();

private:
    PipelineServices services_;

    // Internal state
    mutable std::mutex state_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    JobRequest request_;
    std::string backend_name_;
    JobProgress progress_{0, 0};

    // Callbacks
    mutable std::mutex callbacks_mutex_;
    std::vector<LogCallback> log_callbacks_;
    std::vector<ProgressCallback> progress_callbacks_;
    std::vector<BackendCallback> backend_callbacks_;
    std::vector<FinishedCallback> finished_callbacks_;

    // Threading
    std::mutex thread_mutex_;
    std::unique_ptr<std::thread> worker_thread_;

    // Internal methods
    void worker_loop(JobRequest request);
    void emit_log(const std::string& line);
    void emit_progress(const JobProgress& progress);
    void emit_backend(const std::string& name);
    void emit_finished(const JobResult& result);
};

//==============================================================================
// Job Control Implementation
//==============================================================================

bool TranscriptionControllerImpl::start(const JobRequest& request) {
    std::lock_guard<std::mutex> thread_lock(thread_mutex_);

    if (running_) {
        core::log_warn("Transcription already running");
        return false;
    }

    // Reap the previous job's thread; it has already emitted finished
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        request_ = request;
        backend_name_.clear();
        progress_ = JobProgress{0, 0};
    }

    cancelled_ = false;
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&TranscriptionControllerImpl::worker_loop, this, request);
    return true;
}

void TranscriptionControllerImpl::cancel() {
    if (!running_ || cancelled_) {
        return;
    }
    cancelled_ = true;
    emit_log("Cancellation requested...");
}

void TranscriptionControllerImpl::wait() {
    std::lock_guard<std::mutex> thread_lock(thread_mutex_);
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();
}

bool TranscriptionControllerImpl::is_running() const {
    return running_;
}

ControllerStatus TranscriptionControllerImpl::get_status() const {
    ControllerStatus status;

    if (running_) {
        status.state = cancelled_ ? ControllerStatus::State::CANCELLING
                                  : ControllerStatus::State::RUNNING;
    } else {
        status.state = ControllerStatus::State::IDLE;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    status.url = request_.url;
    status.backend = backend_name_;
    status.progress = progress_;
    return status;
}

//==============================================================================
// Event Subscription Implementation
//==============================================================================

void TranscriptionControllerImpl::subscribe_to_log(LogCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    log_callbacks_.push_back(callback);
}

void TranscriptionControllerImpl::subscribe_to_progress(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    progress_callbacks_.push_back(callback);
}

void TranscriptionControllerImpl::subscribe_to_backend(BackendCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    backend_callbacks_.push_back(callback);
}

void TranscriptionControllerImpl::subscribe_to_finished(FinishedCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    finished_callbacks_.push_back(callback);
}

void TranscriptionControllerImpl::clear_subscriptions() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    log_callbacks_.clear();
    progress_callbacks_.clear();
    backend_callbacks_.clear();
    finished_callbacks_.clear();
}

//==============================================================================
// Internal Methods Implementation
//==============================================================================

void TranscriptionControllerImpl::worker_loop(JobRequest request) {
    core::log_info("Transcription started: " + request.url);

    JobEvents events;
    events.log = [this](const std::string& line) { emit_log(line); };
    events.progress = [this](int current, int total) { emit_progress(JobProgress{current, total}); };
    events.backend = [this](const std::string& name) { emit_backend(name); };

    JobResult result;
    try {
        result = run_transcription(request, services_, events, [this]() { return cancelled_.load(); });
    } catch (const std::exception& e) {
        core::log_error(e.what());
        emit_log(std::string("Error: ") + e.what());
        result.state = JobResult::State::FAILED;
        result.message = e.what();
    }

    core::log_info("Transcription finished: " + result.message);
    running_ = false;
    emit_finished(result);
}

void TranscriptionControllerImpl::emit_log(const std::string& line) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : log_callbacks_) {
        try {
            callback(line);
        } catch (const std::exception& e) {
            core::log_error(std::string("Log callback exception: ") + e.what());
        }
    }
}

void TranscriptionControllerImpl::emit_progress(const JobProgress& progress) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        progress_ = progress;
    }

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : progress_callbacks_) {
        try {
            callback(progress);
        } catch (const std::exception& e) {
            core::log_error(std::string("Progress callback exception: ") + e.what());
        }
    }
}

void TranscriptionControllerImpl::emit_backend(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        backend_name_ = name;
    }

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : backend_callbacks_) {
        try {
            callback(name);
        } catch (const std::exception& e) {
            core::log_error(std::string("Backend callback exception: ") + e.what());
        }
    }
}

void TranscriptionControllerImpl::emit_finished(const JobResult& result) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : finished_callbacks_) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            core::log_error(std::string("Finished callback exception: ") + e.what());
        }
    }
}

//==============================================================================
// TranscriptionController Public Interface (Forwarding to PIMPL)
//==============================================================================

TranscriptionController::TranscriptionController()
    : impl_(std::make_unique<TranscriptionControllerImpl>(default_pipeline_services())) {
}

TranscriptionController::TranscriptionController(PipelineServices services)
    : impl_(std::make_unique<TranscriptionControllerImpl>(std::move(services))) {
}

TranscriptionController::~TranscriptionController() = default;

bool TranscriptionController::start(const JobRequest& request) {
    return impl_->start(request);
}

void TranscriptionController::cancel() {
    impl_->cancel();
}

void TranscriptionController::wait() {
    impl_->wait();
}

bool TranscriptionController::is_running() const {
    return impl_->is_running();
}

ControllerStatus TranscriptionController::get_status() const {
    return impl_->get_status();
}

void TranscriptionController::subscribe_to_log(LogCallback callback) {
    impl_->subscribe_to_log(callback);
}

void TranscriptionController::subscribe_to_progress(ProgressCallback callback) {
    impl_->subscribe_to_progress(callback);
}

void TranscriptionController::subscribe_to_backend(BackendCallback callback) {
    impl_->subscribe_to_backend(callback);
}

void TranscriptionController::subscribe_to_finished(FinishedCallback callback) {
    impl_->subscribe_to_finished(callback);
}

void TranscriptionController::clear_subscriptions() {
    impl_->clear_subscriptions();
}

} // namespace app
