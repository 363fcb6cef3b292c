#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <latch>
#include <mutex>
#include <vector>

#include <oncegate/OnceGate.hpp>

#include "Common.h"

// Locks on every call. Correct, but every caller
// serializes on the mutex even after the action is done.
class AlwaysLockGate
{
public:
    template <typename FuncT>
    void Execute(FuncT&& func)
    {
        std::scoped_lock lock{_mtx};
        if (_done == false)
        {
            _done = true;
            func();
        }
    }

private:
    std::mutex _mtx;
    bool       _done{false};
};

class CallOnceGate
{
public:
    template <typename FuncT>
    void Execute(FuncT&& func)
    {
        std::call_once(_flag, std::forward<FuncT>(func));
    }

private:
    std::once_flag _flag;
};

template <typename GateT>
double MeasureNsPerCall(size_t threadCount, size_t iterations)
{
    GateT gate;
    gate.Execute([] { });

    std::atomic<size_t> sink{0};
    std::latch          start{static_cast<std::ptrdiff_t>(threadCount + 1)};

    std::vector<std::jthread> threads;
    for (size_t i = 0; i < threadCount; ++i)
    {
        threads.emplace_back([&] {
            start.arrive_and_wait();

            size_t local{0};
            for (size_t j = 0; j < iterations; ++j)
            {
                gate.Execute([&local] { ++local; });
            }
            sink.fetch_add(local, std::memory_order::relaxed);
        });
    }

    auto begin = std::chrono::steady_clock::now();
    start.arrive_and_wait();

    for (auto& it : threads)
    {
        it.join();
    }

    auto elapsed = std::chrono::duration<double, std::nano>(std::chrono::steady_clock::now() - begin);

    if (sink.load() != 0)
    {
        SyncOut(std::cerr) << "  action executed twice!\n";
        std::exit(EXIT_FAILURE);
    }

    return elapsed.count() / static_cast<double>(threadCount * iterations);
}

int main(int argc, char* argv[])
{
    size_t iterations = 1'000'000;
    if (argc > 1)
    {
        iterations = std::strtoull(argv[1], nullptr, 10);
    }

    const size_t maxThreads = std::max(1u, std::thread::hardware_concurrency());

    SyncOut() << "Repeated Execute() on a done gate, " << iterations << " calls per thread\n";
    SyncOut() << "threads   OnceGate ns/call   AlwaysLock ns/call   call_once ns/call\n";

    for (size_t threadCount = 1; threadCount <= maxThreads; threadCount *= 2)
    {
        auto onceGate   = MeasureNsPerCall<oncegate::OnceGate>(threadCount, iterations);
        auto alwaysLock = MeasureNsPerCall<AlwaysLockGate>(threadCount, iterations);
        auto callOnce   = MeasureNsPerCall<CallOnceGate>(threadCount, iterations);

        SyncOut() << threadCount << "\t  " << onceGate << "\t\t     " << alwaysLock << "\t\t  " << callOnce << '\n';
    }

    return 0;
}
