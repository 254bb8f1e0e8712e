#include "safetynet/config.hpp"
#include "safetynet/log.hpp"
#include <exception>

namespace safetynet {

AutosaveConfig AutosaveConfig::load(const IConfigProvider& provider) {
    AutosaveConfig cfg;
    try {
        cfg.enabled = provider.getBoolean(kAutosaveEnabledKey);
        cfg.intervalMinutes = provider.getUint(kAutosaveIntervalKey);
    } catch (const std::exception& e) {
        logger()->warn("Autosave settings unavailable ({}); snapshots are disabled.", e.what());
        return AutosaveConfig {};
    }

    if (cfg.enabled && cfg.intervalMinutes == 0) {
        logger()->warn("Autosave interval of 0 minutes; using 1 minute instead.");
        cfg.intervalMinutes = 1;
    }
    if (cfg.intervalMinutes > kMaxIntervalMinutes) {
        logger()->warn("Autosave interval of {} minutes; using {} minutes instead.", cfg.intervalMinutes,
                       kMaxIntervalMinutes);
        cfg.intervalMinutes = kMaxIntervalMinutes;
    }
    logger()->debug("Autosave enabled? {} (every {} min)", cfg.enabled, cfg.intervalMinutes);
    return cfg;
}

} // namespace safetynet
