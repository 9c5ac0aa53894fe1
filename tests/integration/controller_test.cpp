// Background job lifecycle: single-flight start, cancel, failure reporting.

#undef NDEBUG
#include <cassert>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app/transcription_controller.hpp"
#include "../test_support.hpp"

using app::ControllerStatus;
using app::JobResult;
using app::TranscriptionController;
using test_support::FakeWorld;

struct Observed {
    std::mutex mutex;
    std::vector<std::string> lines;
    std::vector<JobResult> finished;
    std::vector<app::JobProgress> progress;
    std::string backend;

    void attach(TranscriptionController& controller) {
        controller.subscribe_to_log([this](const std::string& l) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.push_back(l);
        });
        controller.subscribe_to_progress([this](const app::JobProgress& p) {
            std::lock_guard<std::mutex> lock(mutex);
            progress.push_back(p);
        });
        controller.subscribe_to_backend([this](const std::string& b) {
            std::lock_guard<std::mutex> lock(mutex);
            backend = b;
        });
        controller.subscribe_to_finished([this](const JobResult& r) {
            std::lock_guard<std::mutex> lock(mutex);
            finished.push_back(r);
        });
    }

    bool logged(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& l : lines) {
            if (l == line) return true;
        }
        return false;
    }
};

static void test_completed_job() {
    const auto root = test_support::make_temp_dir("controller_ok");
    auto world = std::make_shared<FakeWorld>();
    world->videos = {{"v1", "One"}, {"v2", "Two"}};
    world->backend_label = "GPU (Vulkan0)";

    TranscriptionController controller(test_support::fake_services(world));
    Observed seen;
    seen.attach(controller);

    assert(!controller.is_running());
    assert(controller.get_status().state == ControllerStatus::State::IDLE);

    assert(controller.start(test_support::fake_request(root)));
    controller.wait();

    assert(!controller.is_running());
    assert(seen.finished.size() == 1);
    assert(seen.finished[0].state == JobResult::State::COMPLETED);
    assert(seen.finished[0].transcripts.size() == 2);
    assert(seen.backend == "GPU (Vulkan0)");
    assert(!seen.progress.empty() && seen.progress.back().percent() == 100);

    const ControllerStatus status = controller.get_status();
    assert(status.state == ControllerStatus::State::IDLE);
    assert(status.url == "https://www.youtube.com/watch?v=abc123");
    assert(status.backend == "GPU (Vulkan0)");
    assert(status.progress.current == 2 && status.progress.total == 2);

    // Controller is reusable once the job is over
    assert(controller.start(test_support::fake_request(root)));
    controller.wait();
    assert(seen.finished.size() == 2);
    assert(test_support::count_files(root / "transcripts") == 4);

    std::filesystem::remove_all(root);
}

static void test_single_flight_and_cancel() {
    const auto root = test_support::make_temp_dir("controller_cancel");
    auto world = std::make_shared<FakeWorld>();
    world->videos = {{"v1", "One"}};

    std::promise<void> entered;
    std::mutex gate_mutex;
    std::condition_variable gate;
    bool open = false;
    world->on_download = [&] {
        entered.set_value();
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate.wait(lock, [&] { return open; });
    };

    TranscriptionController controller(test_support::fake_services(world));
    Observed seen;
    seen.attach(controller);

    assert(controller.start(test_support::fake_request(root)));
    entered.get_future().wait();

    assert(controller.is_running());
    assert(!controller.start(test_support::fake_request(root)));
    assert(controller.get_status().state == ControllerStatus::State::RUNNING);

    controller.cancel();
    assert(controller.get_status().state == ControllerStatus::State::CANCELLING);
    assert(seen.logged("Cancellation requested..."));

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        open = true;
    }
    gate.notify_all();
    controller.wait();

    assert(seen.finished.size() == 1);
    assert(seen.finished[0].state == JobResult::State::CANCELLED);
    assert(seen.finished[0].message == "Cancelled");
    assert(world->transcribe_calls == 0);

    // Cancel while idle is a no-op
    controller.cancel();
    assert(seen.finished.size() == 1);

    std::filesystem::remove_all(root);
}

static void test_failure_reported() {
    const auto root = test_support::make_temp_dir("controller_fail");
    auto world = std::make_shared<FakeWorld>();
    world->download_fails = true;

    TranscriptionController controller(test_support::fake_services(world));
    Observed seen;
    seen.attach(controller);
    // A throwing subscriber must not take the job down
    controller.subscribe_to_log([](const std::string&) { throw std::runtime_error("subscriber"); });

    assert(controller.start(test_support::fake_request(root)));
    controller.wait();

    assert(seen.finished.size() == 1);
    assert(seen.finished[0].state == JobResult::State::FAILED);
    assert(seen.finished[0].message == "ERROR: Video unavailable");
    assert(seen.logged("Error: ERROR: Video unavailable"));
    assert(!controller.is_running());

    std::filesystem::remove_all(root);
}

int main() {
    test_completed_job();
    test_single_flight_and_cancel();
    test_failure_reported();
    return 0;
}
