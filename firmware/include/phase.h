#pragma once
#include <stdint.h>
#include "strip_config.h"

// =====================================================
// Phase
// =====================================================
// One notification from the host: the lighting mode the
// strip should show. Chosen carries the number of
// captures, Reconfigure carries the configuration that
// triggered it. Values are copied through the queue, no
// state is shared with the producer.
// =====================================================

class Phase {
public:
    enum class Kind : uint8_t {
        None,           // Nothing rendered (before first config / after reconfigure)
        Reconfigure,    // Reopen the strip with the carried configuration
        Wait,           // Waiting for a subject
        WaitOrPrint,    // Waiting, previous picture may be printed
        Choose,         // Choosing number of captures
        Chosen,         // Choice made, payload = capture count
        Preview,        // Live preview before a capture
        Capture,        // Taking the picture (flash)
        Processing,     // Assembling the final picture
        Print,          // Printing
        Finish,         // Session finished
        Terminate       // Switch off and stop the controller
    };

    static constexpr uint8_t KIND_COUNT = static_cast<uint8_t>(Kind::Terminate) + 1;

    Phase() : _kind(Kind::None), _captureCount(0) {}
    explicit Phase(Kind kind) : _kind(kind), _captureCount(0) {}

    static Phase chosen(uint8_t captureCount);
    static Phase reconfigure(const StripConfig& config);

    Kind kind() const { return _kind; }
    uint8_t captureCount() const { return _captureCount; }
    const StripConfig& config() const { return _config; }

    bool is(Kind kind) const { return _kind == kind; }

    // Upper-case name used in logs and the host protocol
    const char* name() const { return kindName(_kind); }
    static const char* kindName(Kind kind);

    // Parse a host protocol name (case-insensitive).
    // Returns false for unknown names and for the internal
    // kinds None and Reconfigure.
    static bool parseKind(const char* name, Kind& out);

    bool operator==(const Phase& other) const;
    bool operator!=(const Phase& other) const { return !(*this == other); }

private:
    Kind _kind;
    uint8_t _captureCount;
    StripConfig _config;
};
