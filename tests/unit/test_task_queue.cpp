#include <catch2/catch_test_macros.hpp>
#include <nbfacade/task_queue.h>
#include <stdexcept>
#include <thread>

using namespace nbfacade;

TEST_CASE("TaskQueue drain", "[task_queue]") {
    TaskQueue queue;
    int runs = 0;

    queue.Post([&runs]() { ++runs; });
    queue.Post([&runs]() { ++runs; });
    REQUIRE(queue.GetPendingCount() == 2);

    REQUIRE(queue.Drain() == 2);
    REQUIRE(runs == 2);
    REQUIRE(queue.IsEmpty());
}

TEST_CASE("TaskQueue keyed tasks fold", "[task_queue]") {
    TaskQueue queue;
    int runs = 0;

    REQUIRE(queue.PostOnce("redraw", [&runs]() { ++runs; }));
    REQUIRE_FALSE(queue.PostOnce("redraw", [&runs]() { ++runs; }));
    queue.Drain();
    REQUIRE(runs == 1);

    // Key is free again after the drain
    REQUIRE(queue.PostOnce("redraw", [&runs]() { ++runs; }));
    queue.Drain();
    REQUIRE(runs == 2);
}

TEST_CASE("TaskQueue work posted while draining runs next cycle", "[task_queue]") {
    TaskQueue queue;
    int runs = 0;

    queue.Post([&]() {
        ++runs;
        queue.Post([&runs]() { ++runs; });
    });

    REQUIRE(queue.Drain() == 1);
    REQUIRE(runs == 1);
    REQUIRE(queue.Drain() == 1);
    REQUIRE(runs == 2);
}

TEST_CASE("TaskQueue failing task does not stop the cycle", "[task_queue]") {
    TaskQueue queue;
    int runs = 0;

    queue.Post([]() { throw std::runtime_error("boom"); });
    queue.Post([&runs]() { ++runs; });

    REQUIRE(queue.Drain() == 2);
    REQUIRE(runs == 1);
}

TEST_CASE("TaskQueue accepts posts from other threads", "[task_queue]") {
    TaskQueue queue;
    int runs = 0;

    std::thread worker([&queue, &runs]() {
        for (int i = 0; i < 10; ++i) {
            queue.Post([&runs]() { ++runs; });
        }
    });
    worker.join();

    REQUIRE(queue.Drain() == 10);
    REQUIRE(runs == 10);

    queue.Post([&runs]() { ++runs; });
    queue.Clear();
    REQUIRE(queue.IsEmpty());
}
