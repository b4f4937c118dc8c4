#pragma once
#include <stdint.h>
#include "phase.h"
#include "pixel_driver.h"

// =====================================================
// Animation Library
// =====================================================
// One routine per phase. Each routine renders into the
// device's pixel memory and returns true ("dirty") when
// the strip must be flushed. Routines never call show().
//
// Counters that must survive between ticks live in
// AnimationState, which the controller owns.
// =====================================================

struct AnimationState {
    uint32_t delay = 0;   // ticks since the routine last fired / was entered
    uint8_t hueStep = 0;  // Choose hue in 1/CHOOSE_HUE_STEPS, [0, CHOOSE_HUE_STEPS)
};

struct AnimationContext {
    IPixelDevice& strip;
    AnimationState& state;
    const Phase& phase;
};

typedef bool (*AnimationFn)(AnimationContext& ctx, bool changed);

// Routine for a phase kind, nullptr if the phase renders nothing
AnimationFn animationFor(Phase::Kind kind);

// Run the routine for ctx.phase. Returns its dirty flag,
// false for phases without a routine.
bool animate(AnimationContext& ctx, bool changed);

// Shift every pixel one slot towards index 0; the first
// pixel's color moves to the last slot.
void rotateLeft(IPixelDevice& strip);

// =====================================================
// Routines
// =====================================================

// Tick periods (a routine fires when delay exceeds them)
constexpr uint32_t WAIT_PERIOD_TICKS = 10;        // every 11th tick
constexpr uint32_t CAPTURE_DARK_TICKS = 4;        // black for the first 4 ticks
constexpr uint32_t PROCESSING_PERIOD_TICKS = 50;  // rotate every 51st tick
constexpr uint32_t PRINT_PERIOD_TICKS = 20;       // rotate every 21st tick
constexpr uint8_t CHOOSE_HUE_STEPS = 100;        // one rainbow cycle every 100 ticks

bool animateWait(AnimationContext& ctx, bool changed);
bool animateChoose(AnimationContext& ctx, bool changed);
bool animateChosen(AnimationContext& ctx, bool changed);
bool animatePreview(AnimationContext& ctx, bool changed);
bool animateCapture(AnimationContext& ctx, bool changed);
bool animateProcessing(AnimationContext& ctx, bool changed);
bool animatePrint(AnimationContext& ctx, bool changed);
bool animateFinish(AnimationContext& ctx, bool changed);
