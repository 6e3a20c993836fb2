/**
 * @file worker.hpp
 * @brief Scoped background thread
 *
 * A Worker runs one task on its own thread: enter() starts it, exit()
 * joins it. An exception escaping the task is captured and handed to the
 * joining thread instead of disappearing with the thread.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace cursers {

enum class WorkerState { NotStarted, Running, Stopping, Stopped };

const char *to_string(WorkerState state);

/**
 * @brief Single-use thread that is joined on scope exit
 *
 * Non-copyable. The destructor joins a thread that is still running. A
 * worker destroyed from inside its own task detaches instead; the task and
 * its completion record stay alive until the thread returns.
 */
class Worker {
  public:
    using Task = std::function<void()>;

    /**
     * @brief Construct a worker that has not started
     * @param task Function run on the worker thread
     * @param name Name used in log lines
     */
    explicit Worker(Task task, std::string name = "Worker");

    ~Worker();

    Worker(const Worker &) = delete;
    Worker &operator=(const Worker &) = delete;

    /**
     * @brief Start the thread
     * @throws InvalidState if the worker was already started
     * @throws std::system_error if the thread cannot be created
     *
     * Returns once the thread exists; the task may not have begun yet.
     */
    void enter();

    /**
     * @brief Join the thread and rethrow any exception from the task
     * @throws InvalidState if never started, or if called from the worker itself
     *
     * A second call after the worker has stopped is a no-op.
     */
    void exit();

    /**
     * @brief Join the thread without rethrowing
     * @return std::exception_ptr Exception from the task, or null
     * @throws InvalidState if never started, or if called from the worker itself
     *
     * The returned error is handed over once; later calls return null.
     */
    std::exception_ptr join();

    /**
     * @brief Block until the task has returned (does not join)
     */
    void wait();

    /**
     * @brief Block until the task has returned or the timeout expires
     * @return bool True if the task has returned
     */
    bool wait_for(std::chrono::steady_clock::duration timeout);

    bool is_finished() const;

    // True once the task has ended with an exception
    bool failed() const;

    WorkerState state() const;

    /**
     * @brief enter(), body(), exit(), joining on every path
     */
    void run(const std::function<void()> &body);

  private:
    // Shared with the thread so that it never touches the Worker itself
    struct Completion {
        Task task;
        mutable std::mutex mutex;
        std::condition_variable finished_cv;
        bool finished{false};
        bool failed{false};
        std::exception_ptr error; ///< Cleared once handed to a joiner
    };

    static void thread_main(std::shared_ptr<Completion> completion);

    std::string name_;
    std::shared_ptr<Completion> completion_;
    std::thread thread_;
    WorkerState state_{WorkerState::NotStarted}; ///< Guarded by completion_->mutex
};

/**
 * @brief Best-effort description of a captured exception
 */
std::string describe(const std::exception_ptr &error);

} // namespace cursers
