#include "animations.h"
#include "platform_random.h"

// Routine table, indexed by Phase::Kind. WaitOrPrint shares
// the Wait animation; only its button blinkers differ.
static const AnimationFn ANIMATION_TABLE[Phase::KIND_COUNT] = {
    nullptr,            // None
    nullptr,            // Reconfigure
    animateWait,        // Wait
    animateWait,        // WaitOrPrint
    animateChoose,      // Choose
    animateChosen,      // Chosen
    animatePreview,     // Preview
    animateCapture,     // Capture
    animateProcessing,  // Processing
    animatePrint,       // Print
    animateFinish,      // Finish
    nullptr             // Terminate
};

AnimationFn animationFor(Phase::Kind kind) {
    uint8_t index = static_cast<uint8_t>(kind);
    if (index >= Phase::KIND_COUNT) {
        return nullptr;
    }
    return ANIMATION_TABLE[index];
}

bool animate(AnimationContext& ctx, bool changed) {
    AnimationFn fn = animationFor(ctx.phase.kind());
    if (!fn) {
        return false;
    }
    return fn(ctx, changed);
}

void rotateLeft(IPixelDevice& strip) {
    uint16_t count = strip.pixelCount();
    if (count < 2) {
        return;
    }
    Rgb first = strip.getPixel(0);
    for (uint16_t i = 0; i + 1 < count; i++) {
        strip.setPixel(i, strip.getPixel(i + 1));
    }
    strip.setPixel(count - 1, first);
}

// =====================================================
// Routines
// =====================================================

bool animateWait(AnimationContext& ctx, bool changed) {
    if (changed) {
        ctx.state.delay = 0;
    }
    ctx.state.delay++;
    if (ctx.state.delay <= WAIT_PERIOD_TICKS) {
        return false;
    }

    ctx.state.delay = 0;
    uint16_t count = ctx.strip.pixelCount();
    for (uint16_t i = 0; i < count; i++) {
        float hue = platform_random_unit();
        float saturation = platform_random_range(50, 100) / 100.0f;
        float value = platform_random_unit();
        ctx.strip.setPixel(i, hsvToRgb(hue, saturation, value));
    }
    return true;
}

bool animateChoose(AnimationContext& ctx, bool changed) {
    (void)changed;
    float hue = static_cast<float>(ctx.state.hueStep) / CHOOSE_HUE_STEPS;
    uint16_t count = ctx.strip.pixelCount();
    for (uint16_t i = 0; i < count; i++) {
        float offset = static_cast<float>(i) / count;
        ctx.strip.setPixel(i, hsvToRgb(hue + offset));
    }

    // Counted in whole steps so the cycle does not drift
    ctx.state.hueStep++;
    if (ctx.state.hueStep >= CHOOSE_HUE_STEPS) {
        ctx.state.hueStep = 0;
    }
    return true;
}

bool animateChosen(AnimationContext& ctx, bool changed) {
    (void)changed;
    float hue = ctx.phase.captureCount() / 4.0f + 0.5f;
    ctx.strip.fill(hsvToRgb(hue));
    return true;
}

bool animatePreview(AnimationContext& ctx, bool changed) {
    (void)changed;
    ctx.strip.fill(COLOR_WHITE);
    return true;
}

bool animateCapture(AnimationContext& ctx, bool changed) {
    if (changed) {
        ctx.state.delay = 0;
    }
    ctx.state.delay++;
    ctx.strip.fill(ctx.state.delay > CAPTURE_DARK_TICKS ? COLOR_WHITE : COLOR_BLACK);
    return true;
}

bool animateProcessing(AnimationContext& ctx, bool changed) {
    bool dirty = false;
    if (changed) {
        ctx.state.delay = 0;
        // Only complete triples are painted; a trailing
        // remainder keeps its previous color. The new pattern
        // reaches the LEDs with the first rotation.
        uint16_t count = ctx.strip.pixelCount();
        for (uint16_t i = 0; i + 2 < count; i += 3) {
            ctx.strip.setPixel(i, COLOR_RED);
            ctx.strip.setPixel(i + 1, COLOR_GREEN);
            ctx.strip.setPixel(i + 2, COLOR_BLUE);
        }
    }

    ctx.state.delay++;
    if (ctx.state.delay > PROCESSING_PERIOD_TICKS) {
        ctx.state.delay = 0;
        rotateLeft(ctx.strip);
        dirty = true;
    }
    return dirty;
}

bool animatePrint(AnimationContext& ctx, bool changed) {
    bool dirty = false;
    if (changed) {
        ctx.state.delay = 0;
        // Shown with the first rotation, like Processing
        ctx.strip.fill(COLOR_BLACK);
        uint16_t count = ctx.strip.pixelCount();
        for (uint16_t i = 0; i < count; i += 3) {
            ctx.strip.setPixel(i, COLOR_WHITE);
        }
    }

    ctx.state.delay++;
    if (ctx.state.delay > PRINT_PERIOD_TICKS) {
        ctx.state.delay = 0;
        rotateLeft(ctx.strip);
        dirty = true;
    }
    return dirty;
}

bool animateFinish(AnimationContext& ctx, bool changed) {
    if (!changed) {
        return false;
    }
    ctx.strip.fill(COLOR_GOLD);
    return true;
}
