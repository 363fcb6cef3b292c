#ifndef ONCE_GATE_LAZY_INIT_EXAMPLE_H
#define ONCE_GATE_LAZY_INIT_EXAMPLE_H

#include <map>
#include <string>
#include <vector>

#include <oncegate/OnceGate.hpp>

#include "Common.h"

// The gate is owned next to the state it guards
// and shared by every call site which needs the table.
class Dictionary
{
public:
    const std::string& Lookup(int32_t key)
    {
        _gate.Execute(&Dictionary::Load, this);
        return _table.at(key);
    }

private:
    void Load()
    {
        SyncOut() << "  Loading dictionary... Thread id: " << std::this_thread::get_id() << '\n';
        std::this_thread::sleep_for(50ms);

        _table = {{1, "one"}, {2, "two"}, {3, "three"}};
    }

    oncegate::OnceGate             _gate;
    std::map<int32_t, std::string> _table;
};

void Example_lazyInit()
{
    SyncOut() << "\n\nExample_lazyInit:\n";

    Dictionary dictionary;

    std::vector<std::jthread> threads;
    for (int32_t i = 1; i <= 3; ++i)
    {
        threads.emplace_back([&dictionary, i] { SyncOut() << "  " << i << " -> " << dictionary.Lookup(i) << '\n'; });
    }
}

#endif // ONCE_GATE_LAZY_INIT_EXAMPLE_H
