#include <catch2/catch.hpp>
#include <opflow/detail/action_lane.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

TEST_CASE("action_lane runs actions in posting order", "[detail][lane]") {
    opflow::detail::action_lane lane{[](std::exception_ptr) {}};
    std::vector<int> order;
    for (int i = 0; i < 10; i++)
        lane.execute([&order, i]() { order.push_back(i); });
    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
}

TEST_CASE("action_lane queues actions posted from within an action", "[detail][lane]") {
    opflow::detail::action_lane lane{[](std::exception_ptr) {}};
    std::vector<int> order;
    lane.execute([&]() {
        order.push_back(1);
        lane.execute([&]() { order.push_back(3); });
        // The nested action didn't run yet
        order.push_back(2);
    });
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("action_lane reports exceptions and keeps going", "[detail][lane]") {
    int num_errors = 0;
    opflow::detail::action_lane lane{[&](std::exception_ptr) { num_errors++; }};
    bool second_ran = false;
    lane.execute([]() { throw std::runtime_error("first"); });
    lane.execute([&]() { second_ran = true; });
    REQUIRE(num_errors == 1);
    REQUIRE(second_ran);
}

TEST_CASE("action_lane never runs two actions at the same time", "[detail][lane]") {
    opflow::detail::action_lane lane{[](std::exception_ptr) {}};
    constexpr int num_threads = 8;
    constexpr int num_iter = 500;
    // Not atomic on purpose; the lane serializes the increments
    int counter = 0;
    std::atomic<int> inside{0};
    std::atomic<int> overlaps{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&]() {
            for (int j = 0; j < num_iter; j++) {
                lane.execute([&]() {
                    if (inside++ != 0)
                        overlaps++;
                    counter++;
                    inside--;
                });
            }
        });
    }
    for (auto& th : threads)
        th.join();

    REQUIRE(overlaps.load() == 0);
    REQUIRE(counter == num_threads * num_iter);
}
