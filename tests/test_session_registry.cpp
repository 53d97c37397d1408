#include "SessionRegistry.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace proctor;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

int main() {
    std::cout << "=== SessionRegistry Test ===" << std::endl;

    // Test 1: Create, duplicate, empty id
    {
        SessionRegistry registry;
        assert_true(registry.create("exam-1") == SessionRegistry::CreateStatus::CREATED, "session created");
        assert_true(registry.create("exam-1") == SessionRegistry::CreateStatus::ALREADY_EXISTS, "duplicate refused");
        assert_true(registry.create("") == SessionRegistry::CreateStatus::INVALID_ID, "empty id refused");
        assert_true(registry.size() == 1 && registry.contains("exam-1"), "one live session");
        assert_true(std::string(SessionRegistry::create_status_to_string(
                        SessionRegistry::CreateStatus::CAPACITY_REACHED)) == "capacity_reached",
                    "status names");
    }

    // Test 2: Unknown ids fail closed
    {
        SessionRegistry registry;
        assert_true(registry.find("ghost") == nullptr, "unknown id not found");
        assert_true(registry.size() == 0, "lookup creates nothing");
        assert_true(registry.remove("ghost") == nullptr, "removing unknown id returns nullptr");
    }

    // Test 3: Capacity limit
    {
        SessionRegistry registry(2);
        registry.create("a");
        registry.create("b");
        assert_true(registry.create("c") == SessionRegistry::CreateStatus::CAPACITY_REACHED, "third session refused");
        registry.remove("a");
        assert_true(registry.create("c") == SessionRegistry::CreateStatus::CREATED, "slot freed by remove");
        assert_true(registry.capacity() == 2, "capacity reported");
    }

    // Test 4: Remove raises the cancel flag on a still referenced state
    {
        SessionRegistry registry;
        registry.create("exam-2", 3);
        auto held = registry.find("exam-2");
        assert_true(held && !held->is_ended(), "live session not ended");
        assert_true(held->executor.thread_count() == 3, "session executor sized on create");

        auto removed = registry.remove("exam-2");
        assert_true(removed == held, "remove returns the same state");
        assert_true(held->is_ended(), "held reference sees the end");
        assert_true(!registry.contains("exam-2"), "removed from registry");
    }

    // Test 5: Re-creating an ended id gives fresh state
    {
        SessionRegistry registry;
        registry.create("exam-3");
        auto first = registry.find("exam-3");
        first->frames_submitted = 12;
        registry.remove("exam-3");

        registry.create("exam-3");
        auto second = registry.find("exam-3");
        assert_true(second != first && second->frames_submitted == 0, "state does not carry over");
        assert_true(!second->is_ended(), "new session not ended");
    }

    // Test 6: clear ends everything, ids sorted
    {
        SessionRegistry registry;
        registry.create("charlie");
        registry.create("alpha");
        registry.create("bravo");
        auto ids = registry.session_ids();
        assert_true(ids.size() == 3 && ids[0] == "alpha" && ids[2] == "charlie", "ids sorted");

        auto held = registry.find("bravo");
        registry.clear();
        assert_true(registry.size() == 0, "registry empty after clear");
        assert_true(held->is_ended(), "cleared session ended");
    }

    // Test 7: Concurrent creates of the same id yield exactly one session
    {
        SessionRegistry registry;
        std::atomic<int> created{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                if (registry.create("shared") == SessionRegistry::CreateStatus::CREATED) {
                    created++;
                }
            });
        }
        for (auto& t : threads) t.join();
        assert_true(created.load() == 1 && registry.size() == 1, "single winner for concurrent create");
    }

    // Test 8: Each session gets its own executor
    {
        SessionRegistry registry;
        registry.create("left");
        registry.create("right");
        auto left = registry.find("left");
        auto right = registry.find("right");
        assert_true(&left->executor != &right->executor, "executors not shared");
        assert_true(left->executor.thread_count() == 2, "default executor has one thread per branch");

        // A busy executor does not hold up another session's work
        std::atomic<bool> release{false};
        auto blocker = left->executor.submit([&release] {
            while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        });
        auto blocker2 = left->executor.submit([&release] {
            while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        });
        auto quick = right->executor.submit([] { return 7; });
        bool ready = quick.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
        assert_true(ready && quick.get() == 7, "other session's executor runs while one is saturated");
        release = true;
        blocker.get();
        blocker2.get();
    }

    if (fails == 0) {
        std::cout << "\nALL TESTS PASSED" << std::endl;
        return 0;
    }
    std::cout << "\nTESTS FAILED: " << fails << std::endl;
    return 1;
}
