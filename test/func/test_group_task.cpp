#include <catch2/catch.hpp>
#include <opflow/group_task.hpp>
#include <opflow/block_condition.hpp>
#include <opflow/errors.hpp>

#include "test_common/task_utils.hpp"

TEST_CASE("a group finishes after all its children", "[group]") {
    opflow::scheduler sched;
    event_log log;
    auto c1 = make_logging_task(log, "c1");
    auto c2 = make_logging_task(log, "c2");
    auto c3 = make_logging_task(log, "c3");
    auto group = std::make_shared<opflow::group_task>(std::vector<opflow::task_ptr>{c1, c2, c3});
    REQUIRE(group->name() == "Group");
    auto after = make_logging_task(log, "after");
    after->add_dependency(group);

    REQUIRE(sched.submit({group, after}) == 2);
    REQUIRE(after->wait_for(1s));
    REQUIRE(group->is_finished());
    REQUIRE_FALSE(group->has_errors());
    REQUIRE(log.events().size() == 4);
    REQUIRE(log.index_of("after") == 3);
}

TEST_CASE("a group collects the errors of its children", "[group]") {
    opflow::scheduler sched;
    auto ok1 = make_task([]() {}, "ok1");
    auto bad = make_task([]() { throw std::runtime_error("child failed"); }, "bad");
    auto ok2 = make_task([]() {}, "ok2");
    auto group = std::make_shared<opflow::group_task>(
            std::vector<opflow::task_ptr>{ok1, bad, ok2}, "three children");
    REQUIRE(sched.submit(group));
    REQUIRE(group->wait_for(1s));

    REQUIRE(ok1->is_finished());
    REQUIRE(ok2->is_finished());
    REQUIRE_FALSE(ok1->is_cancelled());
    REQUIRE_FALSE(ok2->is_cancelled());
    REQUIRE_FALSE(group->is_cancelled());
    auto errs = group->errors();
    REQUIRE(errs.size() == 1);
    REQUIRE(error_is<opflow::execution_error>(errs[0]));
}

TEST_CASE("vetoed children report their errors to the group", "[group]") {
    opflow::scheduler sched{inline_options()};
    auto vetoed = make_task([]() {}, "vetoed");
    vetoed->add_condition(
            std::make_shared<opflow::block_condition>("Never", []() { return false; }));
    auto group = std::make_shared<opflow::group_task>(std::vector<opflow::task_ptr>{vetoed},
            "group", inline_options("children"));
    REQUIRE(sched.submit(group));
    REQUIRE(group->is_finished());
    REQUIRE(group->errors().size() == 1);
    REQUIRE(error_is<opflow::condition_failed>(group->errors()[0]));
}

TEST_CASE("an empty group finishes immediately", "[group]") {
    opflow::scheduler sched{inline_options()};
    auto group = std::make_shared<opflow::group_task>();
    REQUIRE(sched.submit(group));
    REQUIRE(group->is_finished());
    REQUIRE_FALSE(group->has_errors());
}

TEST_CASE("children don't start before the group", "[group]") {
    opflow::scheduler sched{inline_options()};
    auto gate = std::make_shared<manual_task>("gate");
    auto child = std::make_shared<manual_task>("child");
    auto group = std::make_shared<opflow::group_task>(
            std::vector<opflow::task_ptr>{child}, "group", inline_options("children"));
    group->add_dependency(gate);
    REQUIRE(group->num_unfinished_children() == 1);

    REQUIRE(sched.submit({gate, group}) == 2);
    REQUIRE(child->num_executions() == 0);
    gate->complete();
    REQUIRE(child->num_executions() == 1);
    REQUIRE(group->get_state() == opflow::task::state::executing);
    child->complete();
    REQUIRE(group->is_finished());
    REQUIRE(group->num_unfinished_children() == 0);
}

TEST_CASE("the children of a group keep their dependencies", "[group]") {
    opflow::scheduler sched;
    event_log log;
    auto first = make_logging_task(log, "first");
    auto second = make_logging_task(log, "second");
    second->add_dependency(first);
    auto group = std::make_shared<opflow::group_task>(std::vector<opflow::task_ptr>{second, first});
    REQUIRE(sched.submit(group));
    REQUIRE(group->wait_for(1s));
    REQUIRE(log.events() == std::vector<std::string>{"first", "second"});
}

TEST_CASE("children can be added while the group is executing", "[group]") {
    opflow::scheduler sched{inline_options()};
    auto first = std::make_shared<manual_task>("first");
    auto group = std::make_shared<opflow::group_task>(
            std::vector<opflow::task_ptr>{first}, "group", inline_options("children"));
    REQUIRE(sched.submit(group));
    REQUIRE(first->num_executions() == 1);

    auto late = std::make_shared<manual_task>("late");
    REQUIRE(group->add_child(late));
    REQUIRE(late->num_executions() == 1);
    REQUIRE(group->num_unfinished_children() == 2);

    first->complete();
    REQUIRE_FALSE(group->is_finished());
    late->complete();
    REQUIRE(group->is_finished());

    // Adding children to a finished group throws
    REQUIRE_THROWS_AS(group->add_child(make_task([]() {})), std::logic_error);
}

TEST_CASE("tasks produced by children belong to the group", "[group]") {
    opflow::scheduler sched{inline_options()};
    auto produced = std::make_shared<manual_task>("produced");
    auto producer = std::make_shared<opflow::block_task>(
            [produced](opflow::finish_signal done) {
                done.target()->produce(produced);
                done();
            },
            "producer");
    auto group = std::make_shared<opflow::group_task>(
            std::vector<opflow::task_ptr>{producer}, "group", inline_options("children"));
    REQUIRE(sched.submit(group));
    REQUIRE(producer->is_finished());
    REQUIRE(produced->num_executions() == 1);
    REQUIRE_FALSE(group->is_finished());
    produced->complete();
    REQUIRE(group->is_finished());
}

TEST_CASE("cancelling a group cancels its children", "[group]") {
    opflow::scheduler sched{inline_options()};
    auto running = std::make_shared<manual_task>("running", true);
    auto waiting = std::make_shared<manual_task>("waiting");
    waiting->add_dependency(running);
    auto group = std::make_shared<opflow::group_task>(
            std::vector<opflow::task_ptr>{running, waiting}, "group", inline_options("children"));
    REQUIRE(sched.submit(group));
    REQUIRE(running->num_executions() == 1);

    group->cancel();
    REQUIRE(group->wait_for(1s));
    REQUIRE(group->is_cancelled());
    REQUIRE(running->is_cancelled());
    REQUIRE(waiting->is_cancelled());
    REQUIRE(waiting->num_executions() == 0);
    REQUIRE_FALSE(group->has_errors());
}

TEST_CASE("a group cancelled before starting doesn't run its children", "[group]") {
    opflow::scheduler sched{inline_options()};
    auto child = std::make_shared<manual_task>("child");
    auto group = std::make_shared<opflow::group_task>(
            std::vector<opflow::task_ptr>{child}, "group", inline_options("children"));
    group->cancel();
    REQUIRE(child->is_cancelled());
    REQUIRE(sched.submit(group));
    REQUIRE(group->is_finished());
    REQUIRE(child->num_executions() == 0);
}

TEST_CASE("cancelling a group doesn't wait for pending condition verdicts", "[group]") {
    opflow::scheduler sched{inline_options()};
    auto prompt = std::make_shared<manual_condition>("Prompt");
    auto child = std::make_shared<manual_task>("child");
    child->add_condition(prompt);
    auto group = std::make_shared<opflow::group_task>(
            std::vector<opflow::task_ptr>{child}, "group", inline_options("children"));
    REQUIRE(sched.submit(group));
    REQUIRE(prompt->is_evaluated());
    REQUIRE(child->get_state() == opflow::task::state::evaluating_conditions);

    // The verdict never arrives
    group->cancel();
    REQUIRE(child->is_finished());
    REQUIRE(group->is_finished());
    REQUIRE(group->is_cancelled());
    REQUIRE(child->num_executions() == 0);
    REQUIRE(sched.is_idle());
}
