#include <gtest/gtest.h>
#include "core/AdmissionGate.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace ListFile;
using namespace std::chrono_literals;

TEST(AdmissionGate, default_capacity) {
    AdmissionGate gate;
    EXPECT_GE(gate.capacity(), 1);
    EXPECT_EQ(gate.capacity(), gate.available());
}

TEST(AdmissionGate, slot_is_released) {
    AdmissionGate gate(2);
    {
        auto slot = gate.acquire();
        EXPECT_EQ(1, gate.available());
        {
            auto slot2 = gate.acquire();
            EXPECT_EQ(0, gate.available());
        }
        EXPECT_EQ(1, gate.available());
    }
    EXPECT_EQ(2, gate.available());
}

TEST(AdmissionGate, moved_slot_releases_once) {
    AdmissionGate gate(1);
    {
        auto slot = gate.acquire();
        AdmissionGate::Slot moved(std::move(slot));
        EXPECT_EQ(0, gate.available());
    }
    EXPECT_EQ(1, gate.available());
}

TEST(AdmissionGate, bounds_concurrency) {
    AdmissionGate gate(2);
    std::atomic<int> running = 0;
    std::atomic<int> max_running = 0;

    std::vector<std::thread> threads;
    for( int i = 0; i < 8; i++ ){
        threads.emplace_back([&] {
            auto slot = gate.acquire();
            int now = ++running;
            int prev = max_running.load();
            while( now > prev && !max_running.compare_exchange_weak(prev, now) ){
            }
            std::this_thread::sleep_for(10ms);
            --running;
        });
    }
    for( auto& t : threads ){
        t.join();
    }

    EXPECT_LE(max_running.load(), 2);
    EXPECT_EQ(2, gate.available());
}

TEST(AdmissionGate, cancel_while_waiting) {
    AdmissionGate gate(1);
    auto slot = gate.acquire();

    CancelSource cancel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        cancel.cancel();
    });
    EXPECT_THROW(gate.acquire(cancel.token()), Cancelled);
    canceller.join();
    EXPECT_EQ(0, gate.available());
}

TEST(AdmissionGate, cancelled_token_does_not_take_slot) {
    AdmissionGate gate(1);
    CancelSource cancel;
    cancel.cancel();
    EXPECT_THROW(gate.acquire(cancel.token()), Cancelled);
    EXPECT_EQ(1, gate.available());
}
