#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace safetynet {

// Interfaces the host editor implements. Everything is called from the host's
// event loop; none of these need to be thread-safe.

enum class TimerAction {
    Continue,
    Stop,
};

using TimerHandle = std::uint64_t;
using TimerCallback = std::function<TimerAction()>;

class IScheduler {
public:
    virtual ~IScheduler() = default;
    // Calls `cb` every `interval` until it returns Stop or the handle is cancelled.
    virtual TimerHandle every(std::chrono::seconds interval, TimerCallback cb) = 0;
    virtual void cancel(TimerHandle handle) = 0;
};

using SubscriptionId = std::uint64_t;
using SavedHandler = std::function<void()>;

// "saved" notification. Fires only after a successful save under a name.
class INotifier {
public:
    virtual ~INotifier() = default;
    virtual SubscriptionId onSaved(SavedHandler handler) = 0;
    virtual void off(SubscriptionId id) = 0;
};

class IDocument : public INotifier {
public:
    virtual std::string displayName() const = 0;
    virtual bool isUntitled() const = 0;
    // No edits since the document was opened or created.
    virtual bool isUntouched() const = 0;
    virtual std::string fullText() const = 0;
};

// Host settings store. Implementations may throw when a key is unavailable.
class IConfigProvider {
public:
    virtual ~IConfigProvider() = default;
    virtual bool getBoolean(const std::string& key) const = 0;
    virtual unsigned getUint(const std::string& key) const = 0;
};

} // namespace safetynet
