#include "led_controller.h"
#include "board_config.h"
#include "event_log.h"
#include "platform_task.h"
#include "platform_timing.h"

static const char* TAG = "ctrl";

// Button blink presets -------------------------------------------------

struct BlinkPreset {
    bool enabled;
    Rgb onColor;
    Rgb offColor;
    uint16_t onMs;
    uint16_t offMs;
};

static constexpr BlinkPreset PRESET_DISABLED     = {false, COLOR_BLACK, COLOR_BLACK, 0, 0};
static constexpr BlinkPreset PRESET_WAIT         = {true, COLOR_WHITE, COLOR_BLACK, 500, 500};
static constexpr BlinkPreset PRESET_WAIT_INVERSE = {true, COLOR_BLACK, COLOR_WHITE, 500, 500};
static constexpr BlinkPreset PRESET_CHOOSE_LEFT  = {true, COLOR_RED, COLOR_BLACK, 200, 200};
static constexpr BlinkPreset PRESET_CHOOSE_RIGHT = {true, COLOR_GREEN, COLOR_BLACK, 200, 200};
static constexpr BlinkPreset PRESET_PRINT_LEFT   = {true, COLOR_DARK_TEAL, COLOR_BLACK, 200, 600};
static constexpr BlinkPreset PRESET_PRINT_RIGHT  = {true, COLOR_CYAN, COLOR_BLACK, 200, 600};

// Left/right presets for a phase. Returns false for phases
// that keep the blinkers as they are.
static bool presetsFor(Phase::Kind kind, const BlinkPreset*& left, const BlinkPreset*& right) {
    switch (kind) {
        case Phase::Kind::Wait:
            left = &PRESET_WAIT;
            right = &PRESET_DISABLED;
            return true;
        case Phase::Kind::WaitOrPrint:
            left = &PRESET_WAIT;
            right = &PRESET_WAIT_INVERSE;
            return true;
        case Phase::Kind::Choose:
            left = &PRESET_CHOOSE_LEFT;
            right = &PRESET_CHOOSE_RIGHT;
            return true;
        case Phase::Kind::Print:
            left = &PRESET_PRINT_LEFT;
            right = &PRESET_PRINT_RIGHT;
            return true;
        case Phase::Kind::Chosen:
        case Phase::Kind::Finish:
            left = &PRESET_DISABLED;
            right = &PRESET_DISABLED;
            return true;
        default:
            return false;
    }
}

static void applyPreset(Blinker& blinker, const BlinkPreset& preset) {
    blinker.configure(preset.onColor, preset.offColor, preset.onMs, preset.offMs);
    blinker.setEnabled(preset.enabled);
}

// --------------------------------------------------------------------

LedController::LedController(IPixelDriver* driver)
    : _driver(driver)
    , _device(nullptr)
    , _config()
    , _runState(RunState::WaitingForInitialConfig)
    , _current()
    , _animation()
{
}

LedController::~LedController() {
    releaseDevice();
}

// =====================================================
// Host Side
// =====================================================

void LedController::switchState(const Phase& phase) {
    _queue.push(phase);
}

bool LedController::applyConfiguration(const StripConfig& config) {
    if (!_gate.update(config)) {
        return false;
    }
    log_info(TAG, "Configuration changed (channel %d, %u pixels, buttons %d/%d), loading it",
             config.channel, (unsigned)config.pixelCount,
             config.leftButtonPixel, config.rightButtonPixel);
    switchState(Phase::reconfigure(config));
    return true;
}

bool LedController::start() {
    if (!platform_task_start("LEDStrip", taskEntry, this,
                             LED_TASK_STACK_BYTES, LED_TASK_PRIORITY)) {
        log_error(TAG, "Could not start LED strip task");
        return false;
    }
    return true;
}

void LedController::taskEntry(void* arg) {
    static_cast<LedController*>(arg)->run();
}

// =====================================================
// Controller Side
// =====================================================

void LedController::run() {
    log_info(TAG, "Waiting for LED strip configuration");
    while (_runState != RunState::Shutdown) {
        uint32_t waitMs = step();
        if (waitMs > 0) {
            platform_delay_ms(waitMs);
        }
    }
    log_info(TAG, "Controller task finished");
}

uint32_t LedController::step() {
    switch (_runState) {
        case RunState::WaitingForInitialConfig:
            return stepWaitingForConfig();
        case RunState::Running:
            return stepRunning();
        case RunState::Shutdown:
        default:
            return 0;
    }
}

uint32_t LedController::stepWaitingForConfig() {
    // Nothing is rendered before the first configuration;
    // every other phase received until then is dropped.
    Phase next;
    while (_queue.tryPop(next)) {
        if (next.is(Phase::Kind::Reconfigure)) {
            configure(next.config());
            return TICK_MS;
        }
        log_info(TAG, "Ignoring phase '%s' before configuration", next.name());
    }
    return TICK_MS;
}

uint32_t LedController::stepRunning() {
    bool changed = false;

    // At most one notification per tick
    Phase next;
    if (_queue.tryPop(next)) {
        if (next != _current) {
            log_info(TAG, "Switching phase to '%s'", next.name());
            changed = true;
        }
        _current = next;
    }

    if (_current.is(Phase::Kind::Reconfigure)) {
        configure(_current.config());
        return TICK_MS;
    }

    if (_current.is(Phase::Kind::Terminate)) {
        shutdown();
        return 0;
    }

    if (!_device) {
        // No strip: poll slowly until the host reconfigures or terminates
        return NO_DEVICE_POLL_MS;
    }

    if (_current.is(Phase::Kind::None)) {
        return TICK_MS;
    }

    if (changed) {
        applyButtonPresets(_current);
    }

    AnimationContext ctx = {*_device, _animation, _current};
    bool dirty = animate(ctx, changed);

    ButtonOverlay overlays[2] = {
        {_config.leftButtonPixel, &_leftBlinker, COLOR_BLACK, false},
        {_config.rightButtonPixel, &_rightBlinker, COLOR_BLACK, false}
    };
    if (overlayButtons(changed, overlays, 2)) {
        dirty = true;
    }

    if (dirty) {
        _device->show();
    }

    // Animations read the buffer back (rotation), so the
    // overlay must not stay in pixel memory.
    restoreButtons(overlays, 2);
    return TICK_MS;
}

// =====================================================
// Configuration
// =====================================================

void LedController::configure(const StripConfig& config) {
    log_info(TAG, "Reconfiguring");
    releaseDevice();

    _config = config;
    if (_config.leftButtonPixel != StripConfig::NO_PIXEL &&
        !_config.isValidPixel(_config.leftButtonPixel)) {
        log_warn(TAG, "Left button pixel %d out of range, ignored", _config.leftButtonPixel);
        _config.leftButtonPixel = StripConfig::NO_PIXEL;
    }
    if (_config.rightButtonPixel != StripConfig::NO_PIXEL &&
        !_config.isValidPixel(_config.rightButtonPixel)) {
        log_warn(TAG, "Right button pixel %d out of range, ignored", _config.rightButtonPixel);
        _config.rightButtonPixel = StripConfig::NO_PIXEL;
    }

    if (!_config.hasChannel() || _config.pixelCount == 0) {
        log_info(TAG, "No channel or pixel count, disabling LED strip");
    } else if (!_driver || !_driver->available()) {
        log_warn(TAG, "No LED strip support available, LED strip disabled");
    } else {
        log_info(TAG, "Initializing LED strip on channel %d (%u pixels)",
                 _config.channel, (unsigned)_config.pixelCount);
        _device = _driver->open(_config.channel, _config.pixelCount);
        if (!_device) {
            log_error(TAG, "Could not open LED strip on channel %d, LED strip disabled",
                      _config.channel);
        }
    }

    // Wait for the next phase
    _current = Phase();
    _runState = RunState::Running;
}

void LedController::releaseDevice() {
    if (_device) {
        if (_driver) {
            _driver->close(_device);
        }
        _device = nullptr;
    }
}

void LedController::shutdown() {
    if (_device) {
        _device->fill(COLOR_BLACK);
        _device->show();
    }
    releaseDevice();
    _runState = RunState::Shutdown;
    log_info(TAG, "LED strip switched off, controller stopped");
}

// =====================================================
// Button Blinkers
// =====================================================

void LedController::applyButtonPresets(const Phase& phase) {
    const BlinkPreset* left = nullptr;
    const BlinkPreset* right = nullptr;
    if (!presetsFor(phase.kind(), left, right)) {
        return;
    }
    applyPreset(_leftBlinker, *left);
    applyPreset(_rightBlinker, *right);
}

bool LedController::overlayButtons(bool changed, ButtonOverlay* overlays, size_t count) {
    bool dirty = false;
    for (size_t i = 0; i < count; i++) {
        ButtonOverlay& overlay = overlays[i];
        if (!_config.isValidPixel(overlay.pixel)) {
            continue;
        }
        uint16_t pixel = static_cast<uint16_t>(overlay.pixel);

        overlay.saved = _device->getPixel(pixel);
        if (changed) {
            overlay.blinker->reset();
        }
        if (overlay.blinker->advance(TICK_MS)) {
            dirty = true;
        }
        if (overlay.blinker->isEnabled()) {
            _device->setPixel(pixel, overlay.blinker->color());
            overlay.applied = true;
        }
    }
    return dirty;
}

void LedController::restoreButtons(const ButtonOverlay* overlays, size_t count) {
    // Reverse order so a pixel shared by both buttons ends
    // up with its pre-overlay color.
    for (size_t i = count; i > 0; i--) {
        const ButtonOverlay& overlay = overlays[i - 1];
        if (overlay.applied) {
            _device->setPixel(static_cast<uint16_t>(overlay.pixel), overlay.saved);
        }
    }
}
