// -----------------------------------------------------------------------------
//  Copyright (c) 2024 Tamas Kovacs
//  Licensed under the MIT License – see LICENSE.txt for details.
// -----------------------------------------------------------------------------

#ifndef ONCE_GATE_PUBLISH_ON_EXIT_HPP
#define ONCE_GATE_PUBLISH_ON_EXIT_HPP

#include <atomic>
#include <concepts>
#include <memory>
#include <utility>

#include "Diagnostics.hpp"

namespace oncegate {

    namespace concepts {

        // An atomic boolean cell with explicit memory ordering.
        template <typename T>
        concept AtomicFlag = requires (T& t) {
            { t.load(std::memory_order::acquire) } -> std::convertible_to<bool>;
            t.store(true, std::memory_order::release);
        };

    } // namespace concepts

    namespace detail {

        // Scoped guard which publishes "done" into the referenced flag
        // when it leaves its scope, regardless of how the scope is left
        // (normal return or exception unwinding).
        //
        // The store is a release store. Everything the owning thread wrote
        // before the guard is destroyed becomes visible to any thread which
        // observes the flag as true with an acquire load.
        template <concepts::AtomicFlag FlagT>
        class [[nodiscard]] PublishOnExit
        {
        public:
            explicit PublishOnExit(FlagT& flag) noexcept
            : _flag{std::addressof(flag)}
            {
            }

            PublishOnExit(PublishOnExit&& other) noexcept
            : _flag{std::exchange(other._flag, nullptr)}
            {
            }

            // disable copy and move assignment
            PublishOnExit& operator=(PublishOnExit&&) = delete;

            ~PublishOnExit()
            {
                if (_flag)
                {
                    // the flag transitions only once
                    ONCEGATE_ASSERT(_flag->load(std::memory_order::relaxed) == false);

                    _flag->store(true, std::memory_order::release);
                }
            }

        private:
            FlagT* _flag;
        };

        template <concepts::AtomicFlag FlagT>
        [[nodiscard]] auto PublishOnExitOf(FlagT& flag) noexcept
        {
            return PublishOnExit<FlagT>{flag};
        }

    } // namespace detail

} // namespace oncegate

#endif // ONCE_GATE_PUBLISH_ON_EXIT_HPP
