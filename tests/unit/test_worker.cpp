#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "cursers/errors.hpp"
#include "cursers/log.hpp"
#include "cursers/worker.hpp"

using namespace cursers;
using namespace std::chrono_literals;

namespace {

template <typename Error, typename Fn> bool throws(Fn &&fn) {
    try {
        fn();
    } catch (const Error &) {
        return true;
    }
    return false;
}

} // namespace

void test_runs_task_on_other_thread() {
    std::atomic<bool> ran{false};
    std::thread::id task_thread;
    Worker worker([&] {
        task_thread = std::this_thread::get_id();
        ran.store(true);
    });

    assert(worker.state() == WorkerState::NotStarted);
    worker.enter();
    worker.exit();

    assert(ran.load());
    assert(task_thread != std::this_thread::get_id());
    assert(worker.state() == WorkerState::Stopped);
    assert(worker.is_finished());
    assert(!worker.failed());

    std::cout << "✓ test_runs_task_on_other_thread passed" << std::endl;
}

void test_enter_returns_while_task_runs() {
    std::atomic<bool> gate{false};
    std::atomic<bool> done{false};
    Worker worker([&] {
        while (!gate.load()) {
            std::this_thread::sleep_for(1ms);
        }
        done.store(true);
    });

    worker.enter();
    assert(worker.state() == WorkerState::Running);
    assert(!worker.wait_for(20ms));
    assert(!done.load());

    gate.store(true);
    assert(worker.wait_for(5s));
    worker.exit();
    assert(done.load());

    std::cout << "✓ test_enter_returns_while_task_runs passed" << std::endl;
}

void test_task_exception_reaches_joining_thread() {
    std::ostringstream log_out;
    set_log_stream(&log_out);

    Worker worker([] { throw std::runtime_error("task exploded"); }, "Exploder");
    worker.enter();
    worker.wait();
    assert(worker.failed());

    bool caught = false;
    try {
        worker.exit();
    } catch (const std::runtime_error &e) {
        caught = std::string(e.what()) == "task exploded";
    }
    assert(caught);
    assert(worker.state() == WorkerState::Stopped);
    // The joining thread reports the error; the worker thread logs nothing
    assert(log_out.str().empty());

    // Delivered once; a second exit is a no-op
    worker.exit();

    set_log_stream(nullptr);
    std::cout << "✓ test_task_exception_reaches_joining_thread passed" << std::endl;
}

void test_uncollected_error_logged_by_destructor() {
    std::ostringstream log_out;
    set_log_stream(&log_out);
    {
        Worker worker([] { throw std::runtime_error("never collected"); }, "Dropped");
        worker.enter();
        worker.wait();
        assert(log_out.str().empty());
    }
    assert(log_out.str().find("[Dropped] error: task failed and the error was never collected: never collected") !=
           std::string::npos);

    set_log_stream(nullptr);
    std::cout << "✓ test_uncollected_error_logged_by_destructor passed" << std::endl;
}

void test_join_returns_error_without_throwing() {
    std::ostringstream log_out;
    set_log_stream(&log_out);

    Worker worker([] { throw std::invalid_argument("bad input"); });
    worker.enter();
    std::exception_ptr error = worker.join();
    assert(error);
    assert(describe(error) == "bad input");
    assert(throws<std::invalid_argument>([&] { std::rethrow_exception(error); }));
    assert(!worker.join());

    set_log_stream(nullptr);
    std::cout << "✓ test_join_returns_error_without_throwing passed" << std::endl;
}

void test_single_use() {
    Worker worker([] {});
    assert(throws<InvalidState>([&] { worker.exit(); }));
    assert(throws<InvalidState>([&] { worker.join(); }));

    worker.enter();
    assert(throws<InvalidState>([&] { worker.enter(); }));
    worker.exit();
    assert(throws<InvalidState>([&] { worker.enter(); }));

    std::cout << "✓ test_single_use passed" << std::endl;
}

void test_destructor_joins() {
    std::atomic<bool> finished{false};
    {
        Worker worker([&] {
            std::this_thread::sleep_for(30ms);
            finished.store(true);
        });
        worker.enter();
    }
    assert(finished.load());

    std::cout << "✓ test_destructor_joins passed" << std::endl;
}

void test_run_joins_when_body_throws() {
    std::atomic<bool> finished{false};
    Worker worker([&] {
        std::this_thread::sleep_for(10ms);
        finished.store(true);
    });

    assert(throws<std::runtime_error>([&] { worker.run([] { throw std::runtime_error("body failed"); }); }));
    assert(finished.load());
    assert(worker.state() == WorkerState::Stopped);

    std::cout << "✓ test_run_joins_when_body_throws passed" << std::endl;
}

void test_self_join_is_rejected() {
    std::atomic<bool> rejected{false};
    std::atomic<Worker *> self{nullptr};
    Worker worker([&] {
        Worker *me = nullptr;
        while (!(me = self.load())) {
            std::this_thread::yield();
        }
        rejected.store(throws<InvalidState>([&] { me->join(); }));
    });
    worker.enter();
    self.store(&worker);
    worker.exit();
    assert(rejected.load());

    std::cout << "✓ test_self_join_is_rejected passed" << std::endl;
}

void test_destroyed_from_own_task() {
    std::unique_ptr<Worker> owner;
    std::atomic<bool> go{false};
    auto token = std::make_shared<int>(0);
    std::weak_ptr<int> task_alive = token;
    owner = std::make_unique<Worker>([&owner, &go, token] {
        while (!go.load()) {
            std::this_thread::yield();
        }
        owner.reset();
        // Completion is recorded after the Worker is gone
        throw std::runtime_error("failed after destroying its worker");
    });
    token.reset();
    owner->enter();
    go.store(true);

    // The task (and its captured token) is released only when the thread ends
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!task_alive.expired() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    assert(task_alive.expired());

    std::cout << "✓ test_destroyed_from_own_task passed" << std::endl;
}

int main() {
    std::cout << "Running Worker tests..." << std::endl;

    try {
        test_runs_task_on_other_thread();
        test_enter_returns_while_task_runs();
        test_task_exception_reaches_joining_thread();
        test_uncollected_error_logged_by_destructor();
        test_join_returns_error_without_throwing();
        test_single_use();
        test_destructor_joins();
        test_run_joins_when_body_throws();
        test_self_join_is_rejected();
        test_destroyed_from_own_task();
    } catch (const std::exception &e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "All Worker tests passed!" << std::endl;
    return 0;
}
