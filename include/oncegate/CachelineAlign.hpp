// -----------------------------------------------------------------------------
//  Copyright (c) 2024 Tamas Kovacs
//  Licensed under the MIT License – see LICENSE.txt for details.
// -----------------------------------------------------------------------------

#ifndef ONCE_GATE_CACHELINE_ALIGN_HPP
#define ONCE_GATE_CACHELINE_ALIGN_HPP

#include <cstddef>
#include <new> // std::hardware_destructive_interference_size

namespace oncegate { namespace detail {

#ifdef __cpp_lib_hardware_interference_size
    inline constexpr size_t CACHELINE_SIZE = std::hardware_destructive_interference_size;
#else
    // 64 bytes on x86-64 and most aarch64 cores
    inline constexpr size_t CACHELINE_SIZE = 64;
#endif

    // Wraps a value so it occupies a cache line of its own.
    //
    // Used for state that is read on a hot path by many threads
    // while neighbouring state (e.g. a lock word) is written.
    template <typename T>
    struct alignas(CACHELINE_SIZE) CachelineAligned
    {
        T value{};
    };

}} // namespace oncegate::detail

#endif // ONCE_GATE_CACHELINE_ALIGN_HPP
