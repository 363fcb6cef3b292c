#ifndef ONCE_GATE_LATE_CALLER_EXAMPLE_H
#define ONCE_GATE_LATE_CALLER_EXAMPLE_H

#include <latch>

#include <oncegate/OnceGate.hpp>

#include "Common.h"

void Example_lateCaller()
{
    SyncOut() << "\n\nExample_lateCaller:\n";

    oncegate::OnceGate gate;

    int32_t    result{0};
    std::latch started{1};

    std::jthread trigger{[&] {
        gate.Execute([&] {
            SyncOut() << "  Action running... Thread id: " << std::this_thread::get_id() << '\n';
            started.count_down();
            std::this_thread::sleep_for(100ms);
            result = 42;
        });
    }};

    started.wait();
    std::this_thread::sleep_for(10ms);

    auto start = std::chrono::steady_clock::now();
    gate.Execute([] { SyncOut() << "  never printed\n"; });
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    SyncOut() << "  Late caller waited " << waited.count() << "ms, result: " << result << '\n';
}

#endif // ONCE_GATE_LATE_CALLER_EXAMPLE_H
