#ifndef ONCE_GATE_CONCURRENT_INCREMENT_EXAMPLE_H
#define ONCE_GATE_CONCURRENT_INCREMENT_EXAMPLE_H

#include <latch>
#include <vector>

#include <oncegate/OnceGate.hpp>

#include "Common.h"

void Example_concurrentIncrement()
{
    SyncOut() << "\n\nExample_concurrentIncrement:\n";

    oncegate::OnceGate gate;

    int32_t counter{0};

    std::latch start{50};

    std::vector<std::jthread> threads;
    for (int32_t i = 0; i < 50; ++i)
    {
        threads.emplace_back([&] {
            start.arrive_and_wait();
            gate.Execute([&] {
                SyncOut() << "  Incrementing... Thread id: " << std::this_thread::get_id() << '\n';
                ++counter;
            });
        });
    }

    for (auto& it : threads)
    {
        it.join();
    }

    SyncOut() << "  50 callers, counter: " << counter << '\n';
}

#endif // ONCE_GATE_CONCURRENT_INCREMENT_EXAMPLE_H
