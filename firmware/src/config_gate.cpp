#include "config_gate.h"

ConfigGate::ConfigGate()
    : _mutex(platform_mutex_create())
    , _applied()
    , _hasApplied(false)
{
}

ConfigGate::~ConfigGate() {
    if (_mutex) {
        platform_mutex_destroy(_mutex);
        _mutex = nullptr;
    }
}

bool ConfigGate::update(const StripConfig& config) {
    PlatformLock lock(_mutex);
    if (_hasApplied && _applied == config) {
        return false;
    }
    _applied = config;
    _hasApplied = true;
    return true;
}

bool ConfigGate::hasApplied() const {
    PlatformLock lock(_mutex);
    return _hasApplied;
}

StripConfig ConfigGate::applied() const {
    PlatformLock lock(_mutex);
    return _applied;
}
