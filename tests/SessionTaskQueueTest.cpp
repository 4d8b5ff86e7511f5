// =================================================================
// tests/SessionTaskQueueTest.cpp
// =================================================================
// Unit tests for SessionTaskQueue component.

#include "Rewind/SessionTaskQueue.hpp"
#include "TestHelpers.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <cassert>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class SessionTaskQueueTest {
public:
    void testOrdering() {
        std::cout << "Testing per-session ordering..." << std::endl;
        
        Rewind::SessionTaskQueue queue;
        std::mutex order_mutex;
        std::vector<int> order;
        std::vector<std::future<void>> futures;
        
        for (int i = 0; i < 50; ++i) {
            futures.push_back(queue.enqueue("alpha", [i, &order, &order_mutex] {
                if (i % 10 == 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(i);
            }));
        }
        for (auto& future : futures) {
            future.get();
        }
        
        assert(order.size() == 50 && "Every task should run");
        for (int i = 0; i < 50; ++i) {
            assert(order[i] == i && "Tasks should run in submission order");
        }
        
        std::cout << "✓ Ordering test passed" << std::endl;
    }
    
    void testResultsAndExceptions() {
        std::cout << "Testing results and exceptions..." << std::endl;
        
        Rewind::SessionTaskQueue queue;
        auto value = queue.enqueue("alpha", [] { return 41 + 1; });
        assert(value.get() == 42 && "Future should carry the result");
        
        auto failing = queue.enqueue("alpha", []() -> int { throw std::runtime_error("boom"); });
        bool caught = false;
        try {
            failing.get();
        } catch (const std::runtime_error& e) {
            caught = std::string(e.what()) == "boom";
        }
        assert(caught && "Exception should be delivered through the future");
        
        auto after = queue.enqueue("alpha", [] { return std::string("still running"); });
        assert(after.get() == "still running" && "Queue should survive a failing task");
        
        std::cout << "✓ Results and exceptions test passed" << std::endl;
    }
    
    void testIndependentSessions() {
        std::cout << "Testing independent sessions..." << std::endl;
        
        Rewind::SessionTaskQueue queue;
        std::promise<void> release;
        std::shared_future<void> gate = release.get_future().share();
        
        auto blocked = queue.enqueue("slow", [gate] { gate.wait(); return 1; });
        auto other = queue.enqueue("fast", [] { return 2; });
        
        // The second session must not wait behind the blocked one
        assert(other.get() == 2 && "Other session should make progress");
        assert(queue.pendingTasks("slow") == 1 && "Blocked task should still be pending");
        
        release.set_value();
        assert(blocked.get() == 1 && "Blocked task should finish once released");
        queue.waitForIdle("slow");
        assert(queue.pendingTasks("slow") == 0 && "Queue should be idle");
        assert(queue.pendingTasks("unknown") == 0 && "Unknown session has no tasks");
        
        std::cout << "✓ Independent sessions test passed" << std::endl;
    }
    
    void testRunSync() {
        std::cout << "Testing synchronous execution..." << std::endl;
        
        Rewind::SessionTaskQueue queue;
        assert(!queue.isWorkerFor("alpha") && "Test thread is not a worker");
        
        int outer = queue.runSync("alpha", [&queue] {
            assert(queue.isWorkerFor("alpha") && "Task should run on the session worker");
            assert(!queue.isWorkerFor("beta") && "Worker belongs to one session only");
            // Nested calls from the worker must not deadlock
            queue.waitForIdle("alpha");
            return queue.runSync("alpha", [] { return 5; }) + 1;
        });
        assert(outer == 6 && "Nested runSync should run inline");
        
        std::cout << "✓ Run sync test passed" << std::endl;
    }
    
    void testEnqueueFromWorker() {
        std::cout << "Testing tasks queued from a worker..." << std::endl;
        
        Rewind::SessionTaskQueue queue;
        std::atomic<int> steps{0};
        
        queue.runSync("alpha", [&queue, &steps] {
            queue.enqueue("alpha", [&steps] { steps = steps * 10 + 2; });
            steps = steps * 10 + 1;
        });
        queue.waitForIdle("alpha");
        assert(steps == 12 && "Follow-up task should run after the current one");
        
        std::cout << "✓ Enqueue from worker test passed" << std::endl;
    }
    
    void testConcurrentProducers() {
        std::cout << "Testing concurrent producers..." << std::endl;
        
        Rewind::SessionTaskQueue queue;
        int counter = 0;   // Only touched by the worker of "shared"
        std::vector<std::thread> producers;
        for (int t = 0; t < 4; ++t) {
            producers.emplace_back([&queue, &counter] {
                for (int i = 0; i < 100; ++i) {
                    queue.enqueue("shared", [&counter] { counter++; });
                }
            });
        }
        for (auto& producer : producers) {
            producer.join();
        }
        queue.waitForAll();
        assert(counter == 400 && "Serialized tasks should not lose updates");
        
        std::cout << "✓ Concurrent producers test passed" << std::endl;
    }
    
    void testRetire() {
        std::cout << "Testing retirement of a session worker..." << std::endl;
        
        Rewind::SessionTaskQueue queue;
        std::atomic<int> done{0};
        for (int i = 0; i < 5; ++i) {
            queue.enqueue("alpha", [&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                done++;
            });
        }
        queue.runSync("beta", [] { return 0; });
        assert(queue.workerCount() == 2 && "Each key should own a worker");
        
        assert(queue.retire("alpha") && "Known key should be retired");
        assert(done == 5 && "Retire should drain the queued tasks");
        assert(queue.workerCount() == 1 && "Retired key should release its worker");
        assert(queue.pendingTasks("alpha") == 0 && "Retired key has nothing pending");
        assert(!queue.retire("alpha") && "Key without a worker cannot be retired");
        
        bool refused = queue.runSync("beta", [&queue] { return !queue.retire("beta"); });
        assert(refused && "A worker should not retire itself");
        
        assert(queue.runSync("alpha", [] { return 7; }) == 7 && "Retired key should start a new worker on demand");
        assert(queue.workerCount() == 2 && "New worker should be counted");
        
        std::cout << "✓ Retire test passed" << std::endl;
    }
    
    void testShutdown() {
        std::cout << "Testing shutdown..." << std::endl;
        
        Rewind::SessionTaskQueue queue;
        std::atomic<int> done{0};
        for (int i = 0; i < 10; ++i) {
            queue.enqueue("alpha", [&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                done++;
            });
        }
        queue.shutdown();
        assert(done == 10 && "Shutdown should drain queued tasks");
        
        bool rejected = false;
        try {
            queue.enqueue("alpha", [] {});
        } catch (const std::runtime_error&) {
            rejected = true;
        }
        assert(rejected && "Enqueue after shutdown should throw");
        queue.shutdown();
        
        std::cout << "✓ Shutdown test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running SessionTaskQueue unit tests..." << std::endl;
        
        testOrdering();
        testResultsAndExceptions();
        testIndependentSessions();
        testRunSync();
        testEnqueueFromWorker();
        testConcurrentProducers();
        testRetire();
        testShutdown();
        
        std::cout << "All SessionTaskQueue tests passed!" << std::endl;
    }
};

int main() {
    try {
        RewindTest::TempDirectory scratch("rewind_queue");
        RewindTest::quietLogging(scratch);
        
        SessionTaskQueueTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All SessionTaskQueue component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
