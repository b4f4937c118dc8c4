#include "phase.h"
#include <strings.h>

Phase Phase::chosen(uint8_t captureCount) {
    Phase p(Kind::Chosen);
    p._captureCount = captureCount;
    return p;
}

Phase Phase::reconfigure(const StripConfig& config) {
    Phase p(Kind::Reconfigure);
    p._config = config;
    return p;
}

bool Phase::operator==(const Phase& other) const {
    if (_kind != other._kind) {
        return false;
    }
    switch (_kind) {
        case Kind::Chosen:
            return _captureCount == other._captureCount;
        case Kind::Reconfigure:
            return _config == other._config;
        default:
            return true;
    }
}

const char* Phase::kindName(Kind kind) {
    switch (kind) {
        case Kind::None:         return "NONE";
        case Kind::Reconfigure:  return "RECONFIGURE";
        case Kind::Wait:         return "WAIT";
        case Kind::WaitOrPrint:  return "WAIT_OR_PRINT";
        case Kind::Choose:       return "CHOOSE";
        case Kind::Chosen:       return "CHOSEN";
        case Kind::Preview:      return "PREVIEW";
        case Kind::Capture:      return "CAPTURE";
        case Kind::Processing:   return "PROCESSING";
        case Kind::Print:        return "PRINT";
        case Kind::Finish:       return "FINISH";
        case Kind::Terminate:    return "TERMINATE";
        default:                 return "?";
    }
}

bool Phase::parseKind(const char* name, Kind& out) {
    if (!name) {
        return false;
    }
    for (uint8_t i = 0; i < KIND_COUNT; ++i) {
        Kind kind = static_cast<Kind>(i);
        if (kind == Kind::None || kind == Kind::Reconfigure) {
            continue;
        }
        if (strcasecmp(name, kindName(kind)) == 0) {
            out = kind;
            return true;
        }
    }
    return false;
}
