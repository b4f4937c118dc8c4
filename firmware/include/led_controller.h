#pragma once
// =====================================================
// LED Controller
// =====================================================
// Background worker that mirrors the host's phases on
// the light strip. The host side only calls
// switchState() / applyConfiguration(); everything else
// (pixel memory, current phase, blinkers) is owned by the
// controller task and never touched from other tasks.
//
// Lifecycle:
//   WaitingForInitialConfig  discard phases until the first Reconfigure
//   Running                  one tick every TICK_MS
//                            (NO_DEVICE_POLL_MS without a strip)
//   Shutdown                 after Terminate, terminal
//
// Usage (board):
//   LedController leds(createPixelDriver());
//   leds.start();
//   leds.applyConfiguration(cfg);
//   leds.switchState(Phase(Phase::Kind::Wait));
// =====================================================

#include <stdint.h>
#include "animations.h"
#include "blinker.h"
#include "config_gate.h"
#include "phase.h"
#include "phase_queue.h"
#include "pixel_driver.h"
#include "strip_config.h"

class LedController {
public:
    enum class RunState {
        WaitingForInitialConfig,
        Running,
        Shutdown
    };

    static constexpr uint32_t TICK_MS = 10;
    static constexpr uint32_t NO_DEVICE_POLL_MS = 2000;

    // driver may be nullptr (no strip support at all)
    explicit LedController(IPixelDriver* driver);
    ~LedController();

    LedController(const LedController&) = delete;
    LedController& operator=(const LedController&) = delete;

    // =====================================================
    // Host Side (any task)
    // =====================================================

    // Queue a phase change; never blocks the caller
    void switchState(const Phase& phase);

    // Queue a Reconfigure if config differs from the last
    // applied one. Returns true if one was queued.
    bool applyConfiguration(const StripConfig& config);

    // Spawn the controller task running run()
    bool start();

    // =====================================================
    // Controller Side
    // =====================================================

    // Task body: steps until Shutdown
    void run();

    // One unit of work. Returns the number of milliseconds
    // to wait before the next step (0 once shut down).
    uint32_t step();

    // =====================================================
    // Inspection (controller task / tests)
    // =====================================================

    RunState runState() const { return _runState; }
    const Phase& currentPhase() const { return _current; }
    const StripConfig& activeConfig() const { return _config; }
    IPixelDevice* device() const { return _device; }
    const Blinker& leftBlinker() const { return _leftBlinker; }
    const Blinker& rightBlinker() const { return _rightBlinker; }
    const AnimationState& animationState() const { return _animation; }
    size_t pendingNotifications() const { return _queue.size(); }

private:
    struct ButtonOverlay {
        int16_t pixel;
        Blinker* blinker;
        Rgb saved;
        bool applied;
    };

    uint32_t stepWaitingForConfig();
    uint32_t stepRunning();

    void configure(const StripConfig& config);
    void releaseDevice();
    void shutdown();

    void applyButtonPresets(const Phase& phase);
    bool overlayButtons(bool changed, ButtonOverlay* overlays, size_t count);
    void restoreButtons(const ButtonOverlay* overlays, size_t count);

    static void taskEntry(void* arg);

    // Shared with the host side
    PhaseQueue _queue;
    ConfigGate _gate;

    // Owned by the controller task
    IPixelDriver* _driver;
    IPixelDevice* _device;
    StripConfig _config;
    RunState _runState;
    Phase _current;
    AnimationState _animation;
    Blinker _leftBlinker;
    Blinker _rightBlinker;
};
