#pragma once

#include "../core/Address.hpp"
#include "../core/Types.hpp"

#include <functional>

namespace tbhook
{

using TimeSource = std::function<Timestamp()>;

/// Seconds since the Unix epoch from the system clock.
Timestamp SystemTime();

struct HookCreateInfo
{
    // Orchestrator allowed to invoke the hook's phases
    Address authority;

    // Defaults to SystemTime when empty
    TimeSource time_source = {};

    bool verbose = false;
};

} // namespace tbhook
