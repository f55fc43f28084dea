#include "AdmissionGate.hpp"

#include <thread>

namespace ListFile {

static size_t default_slots() {
    size_t n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

AdmissionGate::AdmissionGate(size_t slots) :
    m_capacity(slots == 0 ? default_slots() : slots),
    m_available(m_capacity)
{}

AdmissionGate::Slot AdmissionGate::acquire(const CancelToken& cancel) {
    std::unique_lock<std::mutex> lock(m_mutex);
    // the token has no wakeup of its own, so poll it while waiting
    while( !m_cv.wait_for(lock, CANCEL_POLL_INTERVAL, [&] { return m_available > 0 || cancel.cancelled(); }) ){
    }
    cancel.throw_if_cancelled();
    m_available--;
    return Slot(*this);
}

size_t AdmissionGate::available() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available;
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_available++;
    }
    m_cv.notify_one();
}

} // namespace ListFile
