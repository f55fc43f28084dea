#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "core/cancel.hpp"

namespace ListFile {

// bounds the number of simultaneously running extractions.
// owned by the caller (one per process), passed to FileLister by reference
class AdmissionGate {
    public:
    // releases its slot on destruction
    class Slot {
        public:
        explicit Slot(AdmissionGate& gate) : m_gate(&gate) {}
        ~Slot() { if( m_gate ) m_gate->release(); }

        Slot(Slot&& other) noexcept : m_gate(other.m_gate) { other.m_gate = nullptr; }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot& operator=(Slot&&) = delete;

        private:
        AdmissionGate* m_gate;
    };

    // slots == 0 means one slot per hardware thread
    explicit AdmissionGate(size_t slots = 0);

    // blocks until a slot is free, throws Cancelled if cancel fires while waiting
    Slot acquire(const CancelToken& cancel = {});

    size_t capacity() const { return m_capacity; }
    size_t available() const;

    private:
    void release();

    static constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{20};

    const size_t m_capacity;
    size_t m_available;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace ListFile
