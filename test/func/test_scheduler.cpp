#include <catch2/catch.hpp>
#include <opflow/scheduler.hpp>
#include <opflow/composed_conditions.hpp>
#include <opflow/exclusivity_controller.hpp>
#include <opflow/observer.hpp>
#include <opflow/errors.hpp>

#include "test_common/task_utils.hpp"
#include "test_common/task_countdown.hpp"

#include <atomic>
#include <thread>

namespace {
opflow::condition_ptr exclusive(const std::string& category) {
    return std::make_shared<opflow::mutually_exclusive_condition>(category);
}

//! Delegate that counts the notifications
struct counting_delegate : opflow::scheduler_delegate {
    std::atomic<int> submitted_{0};
    std::atomic<int> finished_{0};
    std::atomic<int> errors_{0};

    void will_submit(const opflow::task_ptr&) override { submitted_++; }
    void did_finish(const opflow::task_ptr&, const opflow::error_list& errs) override {
        errors_ += static_cast<int>(errs.size());
        finished_++;
    }
};
} // namespace

TEST_CASE("scheduler executes tasks on the global executor", "[scheduler]") {
    opflow::scheduler sched;
    REQUIRE(sched.name() == "scheduler");
    constexpr int num_tasks = 10;
    task_countdown tc{num_tasks};
    for (int i = 0; i < num_tasks; i++)
        REQUIRE(sched.submit(make_task([&tc]() { tc.task_finished(); })));
    REQUIRE(tc.wait_for_all());
    REQUIRE(sched.wait_for_idle(1s));
    REQUIRE(sched.is_idle());
}

TEST_CASE("tasks can be submitted only once", "[scheduler]") {
    opflow::scheduler sched{inline_options("first")};
    opflow::scheduler other{inline_options("second")};
    auto t = std::make_shared<manual_task>();
    REQUIRE(sched.submit(t));
    REQUIRE_FALSE(sched.submit(t));
    REQUIRE_FALSE(other.submit(t));
    REQUIRE(t->num_executions() == 1);
    REQUIRE(sched.num_tracked() == 1);
    REQUIRE(other.num_tracked() == 0);
    t->complete();
    REQUIRE(sched.is_idle());
}

TEST_CASE("null tasks are rejected", "[scheduler]") {
    opflow::scheduler sched{inline_options()};
    REQUIRE_FALSE(sched.submit(opflow::task_ptr{}));
    REQUIRE(sched.is_idle());
}

TEST_CASE("submitting multiple tasks reports the accepted ones", "[scheduler]") {
    opflow::scheduler sched{inline_options()};
    auto t1 = make_task([]() {});
    auto t2 = make_task([]() {});
    REQUIRE(sched.submit({t1, t2, t1}) == 2);
}

TEST_CASE("dependencies finish before their dependents start", "[scheduler]") {
    opflow::scheduler sched;
    event_log log;
    auto a = make_logging_task(log, "a");
    auto b = make_logging_task(log, "b");
    auto c = make_logging_task(log, "c");
    auto d = make_logging_task(log, "d");
    // Diamond: a -> (b, c) -> d
    b->add_dependency(a);
    c->add_dependency(a);
    d->add_dependency(b);
    d->add_dependency(c);
    // Submit in reverse order, to make it harder
    REQUIRE(sched.submit({d, c, b, a}) == 4);
    REQUIRE(sched.wait_for_idle(1s));

    REQUIRE(log.events().size() == 4);
    REQUIRE(log.index_of("a") == 0);
    REQUIRE(log.index_of("d") == 3);
}

TEST_CASE("dependencies may be tracked by another scheduler", "[scheduler]") {
    opflow::scheduler s1{inline_options("s1")};
    opflow::scheduler s2{inline_options("s2")};
    event_log log;
    auto dep = std::make_shared<manual_task>("dep");
    auto t = make_logging_task(log, "t");
    t->add_dependency(dep);
    REQUIRE(s2.submit(t));
    REQUIRE(s1.submit(dep));
    REQUIRE(log.events().empty());
    dep->complete();
    REQUIRE(log.index_of("t") == 0);
}

TEST_CASE("dependencies that already finished don't block", "[scheduler]") {
    opflow::scheduler sched{inline_options()};
    event_log log;
    auto dep = make_logging_task(log, "dep");
    REQUIRE(sched.submit(dep));
    REQUIRE(dep->is_finished());

    auto t = make_logging_task(log, "t");
    t->add_dependency(dep);
    REQUIRE(sched.submit(t));
    REQUIRE(log.events() == std::vector<std::string>{"dep", "t"});
}

TEST_CASE("a task cancelled while pending never executes", "[scheduler]") {
    opflow::scheduler sched{inline_options()};
    auto dep = std::make_shared<manual_task>("dep");
    auto t = std::make_shared<manual_task>("t");
    t->add_dependency(dep);
    REQUIRE(sched.submit({dep, t}) == 2);
    REQUIRE(t->get_state() == opflow::task::state::pending);

    t->cancel();
    // Finished right away, without waiting for the dependency
    REQUIRE(t->is_finished());
    REQUIRE(t->num_executions() == 0);
    REQUIRE_FALSE(t->has_errors());

    dep->complete();
    REQUIRE(t->num_executions() == 0);
    REQUIRE(sched.is_idle());
}

TEST_CASE("dependencies of a released task don't affect newer tasks", "[scheduler]") {
    opflow::scheduler sched{inline_options()};
    auto d = std::make_shared<manual_task>("d");
    auto e = std::make_shared<manual_task>("e");
    REQUIRE(sched.submit({d, e}) == 2);

    auto a = std::make_shared<manual_task>("a");
    a->add_dependency(d);
    REQUIRE(sched.submit(a));
    a->cancel();
    REQUIRE(a->is_finished());
    // `d` still holds the listener registered for `a`; the allocator may reuse the memory of `a`
    a.reset();

    auto b = std::make_shared<manual_task>("b");
    b->add_dependency(e);
    REQUIRE(sched.submit(b));
    REQUIRE(b->get_state() == opflow::task::state::pending);

    d->complete();
    REQUIRE(b->get_state() == opflow::task::state::pending);
    REQUIRE(b->num_executions() == 0);

    e->complete();
    REQUIRE(b->num_executions() == 1);
    b->complete();
    REQUIRE(sched.is_idle());
}

TEST_CASE("exclusive tasks run one at a time, in submission order", "[scheduler][exclusivity]") {
    opflow::scheduler sched;
    constexpr int num_tasks = 20;
    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};
    event_log log;
    for (int i = 0; i < num_tasks; i++) {
        auto name = std::to_string(i);
        auto t = make_task(
                [&, name]() {
                    if (++inside > 1)
                        overlapped = true;
                    log.add(name);
                    std::this_thread::sleep_for(100us);
                    --inside;
                },
                name);
        t->add_condition(exclusive("Alert"));
        REQUIRE(sched.submit(t));
    }
    REQUIRE(sched.wait_for_idle(2s));
    REQUIRE_FALSE(overlapped.load());

    auto events = log.events();
    REQUIRE(events.size() == num_tasks);
    for (int i = 0; i < num_tasks; i++)
        REQUIRE(events[i] == std::to_string(i));
    REQUIRE(sched.exclusivity()->num_categories() == 0);
}

TEST_CASE("tasks in different categories don't exclude each other", "[scheduler][exclusivity]") {
    opflow::scheduler sched{inline_options()};
    auto a = std::make_shared<manual_task>("a");
    auto b = std::make_shared<manual_task>("b");
    a->add_condition(exclusive("A"));
    b->add_condition(exclusive("B"));
    REQUIRE(sched.submit({a, b}) == 2);
    REQUIRE(a->num_executions() == 1);
    REQUIRE(b->num_executions() == 1);
    a->complete();
    b->complete();
}

TEST_CASE("exclusivity is released when a task fails or is cancelled", "[scheduler][exclusivity]") {
    opflow::scheduler sched{inline_options()};
    auto first = std::make_shared<manual_task>("first");
    auto vetoed = make_task([]() {}, "vetoed");
    auto cancelled = std::make_shared<manual_task>("cancelled");
    auto last = std::make_shared<manual_task>("last");
    first->add_condition(exclusive("A"));
    vetoed->add_condition(exclusive("A"));
    vetoed->add_condition(std::make_shared<opflow::negated_condition>(exclusive("Other")));
    cancelled->add_condition(exclusive("A"));
    last->add_condition(exclusive("A"));
    REQUIRE(sched.submit({first, vetoed, cancelled, last}) == 4);

    REQUIRE(first->num_executions() == 1);
    REQUIRE(last->num_executions() == 0);
    cancelled->cancel();
    REQUIRE(cancelled->is_finished());
    REQUIRE(last->num_executions() == 0);

    first->complete();
    REQUIRE(vetoed->is_finished());
    REQUIRE(vetoed->has_errors());
    REQUIRE(last->num_executions() == 1);
    REQUIRE(cancelled->num_executions() == 0);
    last->complete();
    REQUIRE(sched.exclusivity()->num_categories() == 0);
}

TEST_CASE("schedulers can share an exclusivity controller", "[scheduler][exclusivity]") {
    auto ctrl = std::make_shared<opflow::exclusivity_controller>();
    auto opts1 = inline_options("s1");
    opts1.exclusivity_ = ctrl;
    auto opts2 = inline_options("s2");
    opts2.exclusivity_ = ctrl;
    opflow::scheduler s1{opts1};
    opflow::scheduler s2{opts2};
    REQUIRE(s1.exclusivity() == ctrl);

    auto a = std::make_shared<manual_task>("a");
    auto b = std::make_shared<manual_task>("b");
    a->add_condition(exclusive("Shared"));
    b->add_condition(exclusive("Shared"));
    REQUIRE(s1.submit(a));
    REQUIRE(s2.submit(b));
    REQUIRE(b->num_executions() == 0);
    a->complete();
    REQUIRE(b->num_executions() == 1);
    b->complete();
}

TEST_CASE("the concurrency limit is honored", "[scheduler]") {
    auto opts = inline_options();
    opts.max_concurrent_ = 2;
    opflow::scheduler sched{opts};
    std::vector<std::shared_ptr<manual_task>> tasks;
    for (int i = 0; i < 4; i++) {
        tasks.push_back(std::make_shared<manual_task>("t" + std::to_string(i)));
        REQUIRE(sched.submit(tasks.back()));
    }
    REQUIRE(tasks[0]->num_executions() == 1);
    REQUIRE(tasks[1]->num_executions() == 1);
    REQUIRE(tasks[2]->num_executions() == 0);
    REQUIRE(tasks[2]->get_state() == opflow::task::state::ready);

    tasks[1]->complete();
    REQUIRE(tasks[2]->num_executions() == 1);
    REQUIRE(tasks[3]->num_executions() == 0);

    SECTION("cancelling a waiting task frees its place in the queue") {
        tasks[3]->cancel();
        REQUIRE(tasks[3]->is_finished());
        tasks[0]->complete();
        tasks[2]->complete();
        REQUIRE(tasks[3]->num_executions() == 0);
    }
    SECTION("finishing tasks lets the others start") {
        tasks[0]->complete();
        REQUIRE(tasks[3]->num_executions() == 1);
        tasks[2]->complete();
        tasks[3]->complete();
    }
    REQUIRE(sched.is_idle());
}

TEST_CASE("a suspended scheduler doesn't start tasks", "[scheduler]") {
    auto opts = inline_options();
    opts.start_suspended_ = true;
    opflow::scheduler sched{opts};
    REQUIRE(sched.is_suspended());

    event_log log;
    auto c = std::make_shared<manual_condition>();
    auto t1 = make_logging_task(log, "t1");
    auto t2 = make_logging_task(log, "t2");
    t2->add_condition(c);
    REQUIRE(sched.submit({t1, t2}) == 2);
    REQUIRE(log.events().empty());
    // Conditions are not evaluated while suspended
    REQUIRE_FALSE(c->is_evaluated());

    sched.resume();
    REQUIRE_FALSE(sched.is_suspended());
    REQUIRE(log.events() == std::vector<std::string>{"t1"});
    REQUIRE(c->is_evaluated());

    sched.suspend();
    c->satisfy();
    REQUIRE(t2->get_state() == opflow::task::state::ready);
    REQUIRE(log.events().size() == 1);
    sched.resume();
    REQUIRE(log.events() == std::vector<std::string>{"t1", "t2"});
}

TEST_CASE("tasks cancelled while suspended finish without executing", "[scheduler]") {
    auto opts = inline_options();
    opts.start_suspended_ = true;
    opflow::scheduler sched{opts};
    auto t = std::make_shared<manual_task>();
    REQUIRE(sched.submit(t));
    t->cancel();
    REQUIRE(t->is_finished());
    sched.resume();
    REQUIRE(t->num_executions() == 0);
}

TEST_CASE("cancel_all cancels all the tracked tasks", "[scheduler]") {
    auto opts = inline_options();
    opts.start_suspended_ = true;
    opflow::scheduler sched{opts};
    std::vector<std::shared_ptr<manual_task>> tasks;
    for (int i = 0; i < 5; i++) {
        tasks.push_back(std::make_shared<manual_task>());
        REQUIRE(sched.submit(tasks.back()));
    }
    REQUIRE(sched.num_tracked() == 5);
    sched.cancel_all();
    REQUIRE(sched.wait_for_idle(1s));
    for (auto& t : tasks) {
        REQUIRE(t->is_cancelled());
        REQUIRE(t->num_executions() == 0);
    }
}

TEST_CASE("destroying the scheduler cancels the tracked tasks", "[scheduler]") {
    auto running = std::make_shared<manual_task>("running", true);
    auto waiting = std::make_shared<manual_task>("waiting");
    waiting->add_dependency(running);
    {
        opflow::scheduler sched{inline_options()};
        REQUIRE(sched.submit({running, waiting}) == 2);
        REQUIRE(running->num_executions() == 1);
    }
    REQUIRE(running->is_cancelled());
    REQUIRE(running->is_finished());
    REQUIRE(waiting->is_finished());
    REQUIRE(waiting->num_executions() == 0);
}

TEST_CASE("the delegate sees all the tasks of the scheduler", "[scheduler]") {
    opflow::scheduler sched{inline_options()};
    auto delegate = std::make_shared<counting_delegate>();
    sched.set_delegate(delegate);

    auto dep = make_task([]() {});
    auto t = make_task([]() { throw std::runtime_error("x"); });
    t->add_condition(std::make_shared<dependency_condition>(dep));
    REQUIRE(sched.submit(t));
    REQUIRE(sched.is_idle());
    REQUIRE(delegate->submitted_.load() == 2);
    REQUIRE(delegate->finished_.load() == 2);
    REQUIRE(delegate->errors_.load() == 1);
}

TEST_CASE("executor failures are reported and finish the task", "[scheduler]") {
    auto opts = inline_options();
    opts.executor_ = [](opflow::work_function) { throw std::runtime_error("executor is full"); };
    opflow::scheduler sched{opts};
    std::vector<std::exception_ptr> reported;
    sched.set_exception_handler([&](std::exception_ptr ex) { reported.push_back(ex); });

    auto t = std::make_shared<manual_task>();
    REQUIRE(sched.submit(t));
    REQUIRE(t->is_finished());
    REQUIRE(t->num_executions() == 0);
    REQUIRE(t->errors().size() == 1);
    REQUIRE(opflow::describe(t->errors()[0]) == "executor is full");
    REQUIRE(reported.size() == 1);
    REQUIRE(sched.is_idle());
}

TEST_CASE("wait_for_idle times out while tasks are running", "[scheduler]") {
    opflow::scheduler sched{inline_options()};
    auto t = std::make_shared<manual_task>();
    REQUIRE(sched.submit(t));
    REQUIRE_FALSE(sched.wait_for_idle(5ms));
    t->complete();
    REQUIRE(sched.wait_for_idle(5ms));
}

TEST_CASE("tasks can be submitted concurrently", "[scheduler]") {
    opflow::scheduler sched;
    constexpr int num_threads = 4;
    constexpr int num_tasks = 100;
    std::atomic<int> executions{0};
    std::atomic<int> finishes{0};
    std::atomic<int> accepted{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++)
        threads.emplace_back([&]() {
            for (int j = 0; j < num_tasks; j++) {
                auto t = make_task([&executions]() { executions++; });
                t->add_observer(std::make_shared<opflow::block_observer>(nullptr, nullptr,
                        [&finishes](opflow::task&, const opflow::error_list&) { finishes++; }));
                if (j % 3 == 0)
                    t->add_condition(exclusive("Serial"));
                if (sched.submit(t))
                    accepted++;
            }
        });
    for (auto& th : threads)
        th.join();

    REQUIRE(accepted.load() == num_threads * num_tasks);
    REQUIRE(sched.wait_for_idle(2s));
    REQUIRE(executions.load() == num_threads * num_tasks);
    REQUIRE(finishes.load() == num_threads * num_tasks);
}

TEST_CASE("tasks cancelled concurrently run at most once", "[scheduler]") {
    opflow::scheduler sched;
    constexpr int num_tasks = 200;
    std::vector<std::atomic<int>> executions(num_tasks);
    std::vector<opflow::task_ptr> tasks;
    for (int i = 0; i < num_tasks; i++)
        tasks.push_back(make_task([&executions, i]() { executions[i]++; }));

    std::thread canceller([&]() {
        for (auto& t : tasks)
            t->cancel();
    });
    for (auto& t : tasks)
        sched.submit(t);
    canceller.join();

    REQUIRE(sched.wait_for_idle(2s));
    for (int i = 0; i < num_tasks; i++) {
        REQUIRE(tasks[i]->is_finished());
        REQUIRE(tasks[i]->is_cancelled());
        REQUIRE_FALSE(tasks[i]->has_errors());
        REQUIRE(executions[i].load() <= 1);
    }
}
