/**
 * @file worker.cpp
 * @brief Worker thread implementation
 */

#include "cursers/worker.hpp"

#include <utility>

#include "cursers/errors.hpp"
#include "cursers/log.hpp"

namespace cursers {

const char *to_string(WorkerState state) {
    switch (state) {
    case WorkerState::NotStarted:
        return "not started";
    case WorkerState::Running:
        return "running";
    case WorkerState::Stopping:
        return "stopping";
    case WorkerState::Stopped:
        return "stopped";
    }
    return "unknown";
}

std::string describe(const std::exception_ptr &error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception &e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

Worker::Worker(Task task, std::string name)
    : name_(std::move(name)), completion_(std::make_shared<Completion>()) {
    completion_->task = std::move(task);
}

Worker::~Worker() {
    if (!thread_.joinable()) {
        return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        // Destroyed from its own task; the thread cannot join itself
        log(LogLevel::Debug, name_, "destroyed from its own task, detaching");
        thread_.detach();
        return;
    }
    std::exception_ptr error = join();
    if (error) {
        log(LogLevel::Error, name_, "task failed and the error was never collected: " + describe(error));
    }
}

void Worker::enter() {
    {
        std::lock_guard<std::mutex> lock(completion_->mutex);
        if (state_ != WorkerState::NotStarted) {
            throw InvalidState(name_ + " is single-use and was already started");
        }
    }

    thread_ = std::thread(&Worker::thread_main, completion_);

    std::lock_guard<std::mutex> lock(completion_->mutex);
    state_ = WorkerState::Running;
    log(LogLevel::Debug, name_, "thread started");
}

void Worker::exit() {
    std::exception_ptr error = join();
    if (error) {
        std::rethrow_exception(error);
    }
}

std::exception_ptr Worker::join() {
    {
        std::lock_guard<std::mutex> lock(completion_->mutex);
        if (state_ == WorkerState::NotStarted && !thread_.joinable()) {
            throw InvalidState(name_ + " was never started");
        }
        if (state_ == WorkerState::Stopped && !thread_.joinable()) {
            return nullptr;
        }
        if (thread_.get_id() == std::this_thread::get_id()) {
            throw InvalidState(name_ + " cannot join itself");
        }
        state_ = WorkerState::Stopping;
    }

    thread_.join();

    std::lock_guard<std::mutex> lock(completion_->mutex);
    state_ = WorkerState::Stopped;
    log(LogLevel::Debug, name_, "thread joined");
    return std::exchange(completion_->error, nullptr);
}

void Worker::wait() {
    std::unique_lock<std::mutex> lock(completion_->mutex);
    completion_->finished_cv.wait(lock, [this] { return completion_->finished; });
}

bool Worker::wait_for(std::chrono::steady_clock::duration timeout) {
    std::unique_lock<std::mutex> lock(completion_->mutex);
    return completion_->finished_cv.wait_for(lock, timeout, [this] { return completion_->finished; });
}

bool Worker::is_finished() const {
    std::lock_guard<std::mutex> lock(completion_->mutex);
    return completion_->finished;
}

bool Worker::failed() const {
    std::lock_guard<std::mutex> lock(completion_->mutex);
    return completion_->failed;
}

WorkerState Worker::state() const {
    std::lock_guard<std::mutex> lock(completion_->mutex);
    return state_;
}

void Worker::run(const std::function<void()> &body) {
    enter();
    try {
        body();
    } catch (...) {
        std::exception_ptr error = join();
        if (error) {
            log(LogLevel::Error, name_, "task failed while unwinding an earlier error: " + describe(error));
        }
        throw;
    }
    exit();
}

// Reports nothing itself: the task may still own the screen, so the joiner
// logs or rethrows the error once the terminal is usable again
void Worker::thread_main(std::shared_ptr<Completion> completion) {
    std::exception_ptr error;
    try {
        if (completion->task) {
            completion->task();
        }
    } catch (...) {
        error = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(completion->mutex);
        completion->error = error;
        completion->failed = (error != nullptr);
        completion->finished = true;
    }
    completion->finished_cv.notify_all();
}

} // namespace cursers
