// -----------------------------------------------------------------------------
//  Copyright (c) 2024 Tamas Kovacs
//  Licensed under the MIT License – see LICENSE.txt for details.
// -----------------------------------------------------------------------------

#ifndef ONCE_GATE_ONCE_GATE_HPP
#define ONCE_GATE_ONCE_GATE_HPP

#include <atomic>
#include <concepts>
#include <functional>
#include <mutex>

#include "CachelineAlign.hpp"
#include "PublishOnExit.hpp"

namespace oncegate {

    namespace concepts {

        template <typename T>
        concept BasicLockable = requires (T& t) {
            t.lock();
            t.unlock();
        };

    } // namespace concepts

    namespace detail {

        // Executes an action exactly once across all the threads
        // that call Execute() on the same gate, and lets none of
        // them return before that single execution has finished.
        //
        // Pending -> Done is the only state transition. It happens
        // after the action returned, or after it threw. A failed action
        // is not retried: the exception reaches the triggering caller
        // only, everybody else simply sees a done gate.
        //
        // Calling Execute() on the same gate from inside the action
        // deadlocks (the lock is not recursive).
        //
        // Usage:
        //    oncegate::OnceGate gate;
        //    gate.Execute([&] { config = LoadConfig(); });
        template <concepts::BasicLockable MutexT>
        class OnceGate
        {
        public:
            OnceGate() = default;

            // disable move and copy
            OnceGate(OnceGate&&) = delete;

            template <typename FuncT, typename... Args>
                requires std::invocable<FuncT, Args...>
            void Execute(FuncT&& func, Args&&... args)
            {
                // fast path, no lock once we are done
                if (_completed.value.load(std::memory_order::acquire)) [[likely]]
                {
                    return;
                }

                ExecuteSlow(std::forward<FuncT>(func), std::forward<Args>(args)...);
            }

            // True if the action has already finished (normally or with an exception).
            [[nodiscard]] bool IsDone() const noexcept { return _completed.value.load(std::memory_order::acquire); }

        private:
            template <typename FuncT, typename... Args>
            void ExecuteSlow(FuncT&& func, Args&&... args)
            {
                // blocks until the running action (if any) has finished
                std::scoped_lock lock{_mtx};

                // the lock orders us after any previous publish
                if (_completed.value.load(std::memory_order::relaxed))
                {
                    return;
                }

                // Declared after the lock, so it is destroyed first:
                // the flag is published before the mutex is released,
                // also if the action throws.
                auto publish = PublishOnExitOf(_completed.value);

                std::invoke(std::forward<FuncT>(func), std::forward<Args>(args)...);
            }

            // read on every call, keep it away from the lock word
            CachelineAligned<std::atomic<bool>> _completed{false};

            MutexT _mtx;
        };

    } // namespace detail

    using OnceGate = detail::OnceGate<std::mutex>;

} // namespace oncegate

#endif // ONCE_GATE_ONCE_GATE_HPP
