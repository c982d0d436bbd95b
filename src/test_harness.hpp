#pragma once
// Host-side test helpers shared by the *_test.cpp programs.
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#define ASSERT_TRUE(condition) \
    if (!(condition)) { \
        std::cerr << "FAILED: " << #condition << " at line " << __LINE__ << std::endl; \
        return false; \
    }

#define ASSERT_EQ(val1, val2) \
    if (!((val1) == (val2))) { \
        std::cerr << "FAILED: " << #val1 << " (" << (val1) << ") != " << #val2 << " (" << (val2) \
                  << ") at line " << __LINE__ << std::endl; \
        return false; \
    }

#define ASSERT_NEAR(val1, val2, abs_error) \
    if (std::abs((val1) - (val2)) > (abs_error)) { \
        std::cerr << "FAILED: " << #val1 << " (" << (val1) << ") != " << #val2 << " (" << (val2) \
                  << ") at line " << __LINE__ << std::endl; \
        return false; \
    }

// Runs fn on a worker thread. A deadlocked worker can never be joined, so a
// missed deadline ends the whole program with a failure instead of hanging.
template <class Fn>
bool finishes_within(std::chrono::milliseconds limit, const char* what, Fn fn) {
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    std::thread worker([done, fn]() mutable {
        fn();
        done->set_value();
    });
    if (fut.wait_for(limit) != std::future_status::ready) {
        std::cerr << "FAILED: " << what << " did not finish within " << limit.count()
                  << " ms (deadlock?)" << std::endl;
        std::_Exit(1);
    }
    worker.join();
    return true;
}

using TestCase = std::pair<const char*, bool (*)()>;

inline int run_tests(const char* suite, const std::vector<TestCase>& tests) {
    std::cout << "Running " << suite << " Unit Tests..." << std::endl;

    bool allPassed = true;
    for (const auto& t : tests) {
        if (t.second()) std::cout << "[PASS] " << t.first << std::endl;
        else { std::cout << "[FAIL] " << t.first << std::endl; allPassed = false; }
    }

    if (allPassed) {
        std::cout << "\nAll Tests Passed Successfully!" << std::endl;
        return 0;
    }
    std::cout << "\nSome Tests Failed." << std::endl;
    return 1;
}
