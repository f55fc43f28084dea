#pragma once
#include <atomic>
#include <memory>

#include "errors.hpp"

namespace ListFile {

// read side of a cancellation flag; a default-constructed token is never cancelled
class CancelToken {
    public:
    CancelToken() = default;
    explicit CancelToken(std::shared_ptr<const std::atomic<bool>> flag) : m_flag(std::move(flag)) {}

    bool cancelled() const {
        return m_flag && m_flag->load(std::memory_order_relaxed);
    }

    void throw_if_cancelled() const {
        if( cancelled() ){
            throw Cancelled();
        }
    }

    private:
    std::shared_ptr<const std::atomic<bool>> m_flag;
};

// owner side, cancel() is async-signal-safe as long as std::atomic<bool> is lock-free
class CancelSource {
    public:
    CancelSource() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true, std::memory_order_relaxed); }
    void reset()  { m_flag->store(false, std::memory_order_relaxed); }
    bool cancelled() const { return m_flag->load(std::memory_order_relaxed); }

    CancelToken token() const { return CancelToken(m_flag); }

    private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace ListFile
