#pragma once

#include "safetynet/host.hpp"
#include <chrono>

namespace safetynet {

inline constexpr const char* kAutosaveEnabledKey = "autosave/enabled";
inline constexpr const char* kAutosaveIntervalKey = "autosave/interval-minutes";
// One day. Longer intervals overflow the millisecond timers of Qt hosts.
inline constexpr unsigned kMaxIntervalMinutes = 24 * 60;

struct AutosaveConfig {
    bool enabled {false};
    unsigned intervalMinutes {10};

    std::chrono::seconds interval() const { return std::chrono::minutes(intervalMinutes); }

    // Never throws; an unreadable provider yields a disabled config.
    static AutosaveConfig load(const IConfigProvider& provider);
};

} // namespace safetynet
