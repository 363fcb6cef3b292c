#include "ConcurrentIncrement_example.h"
#include "LateCaller_example.h"
#include "FailingAction_example.h"
#include "LazyInit_example.h"

int main()
{
    Example_concurrentIncrement();

    Example_lateCaller();

    Example_failingAction();

    Example_lazyInit();

    return 0;
}
