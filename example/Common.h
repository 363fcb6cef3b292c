#ifndef ONCE_GATE_EXAMPLE_COMMON_H
#define ONCE_GATE_EXAMPLE_COMMON_H

#include <syncstream>
#include <iostream>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

inline auto SyncOut(std::ostream& stream = std::cout)
{
    return std::osyncstream{stream};
}

#endif // ONCE_GATE_EXAMPLE_COMMON_H
