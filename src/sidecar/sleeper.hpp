#pragma once

#include <chrono>
#include <functional>
#include <thread>

/// Blocking wait used by the supervisor loops. Tests inject one that returns
/// immediately.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper default_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}
