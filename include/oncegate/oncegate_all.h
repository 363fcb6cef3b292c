// -----------------------------------------------------------------------------
//  Copyright (c) 2024 Tamas Kovacs
//  Licensed under the MIT License – see LICENSE.txt for details.
// -----------------------------------------------------------------------------

#ifndef ONCE_GATE_ONCE_GATE_ALL_H
#define ONCE_GATE_ONCE_GATE_ALL_H

#include "CachelineAlign.hpp"
#include "Diagnostics.hpp"
#include "PublishOnExit.hpp"
#include "OnceGate.hpp"

#endif // ONCE_GATE_ONCE_GATE_ALL_H
