#pragma once
#include "strip_config.h"
#include "platform_mutex.h"

// =====================================================
// Configuration Gate
// =====================================================
// Remembers the last configuration handed to the
// controller and tells whether a new snapshot differs.
// The first snapshot always counts as a change.
// =====================================================

class ConfigGate {
public:
    ConfigGate();
    ~ConfigGate();

    ConfigGate(const ConfigGate&) = delete;
    ConfigGate& operator=(const ConfigGate&) = delete;

    // Returns true (and remembers config) if a reconfiguration
    // is required, false if config equals the applied one.
    bool update(const StripConfig& config);

    bool hasApplied() const;
    StripConfig applied() const;

private:
    platform_mutex_t _mutex;
    StripConfig _applied;
    bool _hasApplied;
};
