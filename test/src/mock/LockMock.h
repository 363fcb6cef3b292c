#ifndef ONCE_GATE_TEST_SRC_MOCK_LOCK_MOCK_H
#define ONCE_GATE_TEST_SRC_MOCK_LOCK_MOCK_H

#include <gmock/gmock.h>

#include <atomic>
#include <mutex>

namespace oncegate { namespace test {

    struct LockMockImpl
    {
        MOCK_METHOD(void, lock, ());
        MOCK_METHOD(void, unlock, ());
    };

    // The gate default constructs its lock, so the
    // expectations are reached through a static pointer.
    template <typename TagT>
    struct LockMock
    {
        static inline LockMockImpl* impl{nullptr};

        void lock() { impl->lock(); }
        void unlock() { impl->unlock(); }
    };

    // Real mutex which counts how many times it was acquired.
    template <typename TagT>
    struct CountingMutex
    {
        static inline std::atomic<size_t> lockCount{0};

        void lock()
        {
            _mtx.lock();
            lockCount.fetch_add(1, std::memory_order::relaxed);
        }

        void unlock() { _mtx.unlock(); }

    private:
        std::mutex _mtx;
    };

}} // namespace oncegate::test

#endif // ONCE_GATE_TEST_SRC_MOCK_LOCK_MOCK_H
