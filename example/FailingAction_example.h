#ifndef ONCE_GATE_FAILING_ACTION_EXAMPLE_H
#define ONCE_GATE_FAILING_ACTION_EXAMPLE_H

#include <latch>
#include <stdexcept>

#include <oncegate/OnceGate.hpp>

#include "Common.h"

void Example_failingAction()
{
    SyncOut() << "\n\nExample_failingAction:\n";

    oncegate::OnceGate gate;

    std::latch started{1};

    std::jthread trigger{[&] {
        try
        {
            gate.Execute([&] {
                started.count_down();
                std::this_thread::sleep_for(50ms);
                throw std::runtime_error{"connection refused"};
            });
        }
        catch (const std::exception& e)
        {
            SyncOut() << "  Trigger caught: " << e.what() << '\n';
        }
    }};

    started.wait();

    // blocked until the action failed, but sees no exception
    gate.Execute([] { SyncOut() << "  never printed\n"; });
    SyncOut() << "  Bystander returned normally, done: " << std::boolalpha << gate.IsDone() << '\n';

    trigger.join();

    gate.Execute([] { SyncOut() << "  never printed\n"; });
    SyncOut() << "  No retry after failure.\n";
}

#endif // ONCE_GATE_FAILING_ACTION_EXAMPLE_H
