// =====================================================
// LED Controller Unit Tests
// =====================================================
// Drives LedController::step() by hand against
// MockPixelDriver. One step() is one controller tick.
//
// Run with: ctest -R test_controller
// =====================================================

#include <unity.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "led_controller.h"
#include "platform_native.h"
#include "../mock_pixel_driver.h"

// =====================================================
// Test Fixtures
// =====================================================

MockPixelDriver* driver = nullptr;
LedController* ctrl = nullptr;

static StripConfig makeConfig(int8_t channel, uint16_t count, int16_t left, int16_t right) {
    StripConfig cfg;
    cfg.channel = channel;
    cfg.pixelCount = count;
    cfg.leftButtonPixel = left;
    cfg.rightButtonPixel = right;
    return cfg;
}

static MockPixelDevice* mockDevice() {
    return static_cast<MockPixelDevice*>(ctrl->device());
}

// Apply config and run the tick that loads it
static void configureAndStep(const StripConfig& cfg) {
    TEST_ASSERT_TRUE(ctrl->applyConfiguration(cfg));
    ctrl->step();
}

static void enterPhase(const Phase& phase) {
    ctrl->switchState(phase);
    ctrl->step();
}

static void stepTimes(int n) {
    for (int i = 0; i < n; i++) {
        ctrl->step();
    }
}

void setUp() {
    driver = new MockPixelDriver();
    ctrl = new LedController(driver);
    platform_native_serial_take_output();
}

void tearDown() {
    delete ctrl;
    ctrl = nullptr;
    delete driver;
    driver = nullptr;
}

// =====================================================
// Initial Configuration
// =====================================================

void test_initial_state() {
    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::WaitingForInitialConfig);
    TEST_ASSERT_NULL(ctrl->device());
    TEST_ASSERT_TRUE(ctrl->currentPhase().is(Phase::Kind::None));
}

void test_phases_before_config_are_discarded() {
    ctrl->switchState(Phase(Phase::Kind::Wait));
    ctrl->switchState(Phase(Phase::Kind::Choose));

    TEST_ASSERT_EQUAL_UINT32(LedController::TICK_MS, ctrl->step());
    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::WaitingForInitialConfig);
    TEST_ASSERT_EQUAL(0, ctrl->pendingNotifications());
    TEST_ASSERT_EQUAL(0, driver->openCallCount);

    std::string out = platform_native_serial_take_output();
    TEST_ASSERT_TRUE(out.find("Ignoring phase 'WAIT'") != std::string::npos);
    TEST_ASSERT_TRUE(out.find("Ignoring phase 'CHOOSE'") != std::string::npos);
}

void test_first_config_opens_device() {
    configureAndStep(makeConfig(1, 12, -1, -1));

    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::Running);
    TEST_ASSERT_EQUAL(1, driver->openCallCount);
    TEST_ASSERT_EQUAL_INT8(1, driver->lastChannel);
    TEST_ASSERT_EQUAL_UINT16(12, driver->lastPixelCount);
    TEST_ASSERT_NOT_NULL(ctrl->device());
    TEST_ASSERT_TRUE(ctrl->currentPhase().is(Phase::Kind::None));
}

void test_waiting_stops_at_reconfigure() {
    ctrl->switchState(Phase(Phase::Kind::Wait));
    ctrl->applyConfiguration(makeConfig(0, 12, -1, -1));
    ctrl->switchState(Phase(Phase::Kind::Choose));

    ctrl->step();
    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::Running);
    TEST_ASSERT_EQUAL(1, ctrl->pendingNotifications());

    ctrl->step();
    TEST_ASSERT_TRUE(ctrl->currentPhase().is(Phase::Kind::Choose));
}

void test_none_phase_renders_nothing() {
    configureAndStep(makeConfig(0, 12, 0, 11));

    TEST_ASSERT_EQUAL_UINT32(LedController::TICK_MS, ctrl->step());
    TEST_ASSERT_EQUAL(0, mockDevice()->pixelOperationCount());
}

// =====================================================
// Phase Handling
// =====================================================

void test_phase_change_renders_and_shows() {
    configureAndStep(makeConfig(0, 12, -1, -1));

    enterPhase(Phase(Phase::Kind::Preview));
    TEST_ASSERT_EQUAL(1, mockDevice()->showCallCount);
    TEST_ASSERT_TRUE(mockDevice()->allPixels(COLOR_WHITE));
}

void test_one_notification_per_tick() {
    configureAndStep(makeConfig(0, 12, -1, -1));

    ctrl->switchState(Phase(Phase::Kind::Wait));
    ctrl->switchState(Phase(Phase::Kind::Choose));

    ctrl->step();
    TEST_ASSERT_TRUE(ctrl->currentPhase().is(Phase::Kind::Wait));
    TEST_ASSERT_EQUAL(1, ctrl->pendingNotifications());

    ctrl->step();
    TEST_ASSERT_TRUE(ctrl->currentPhase().is(Phase::Kind::Choose));
}

void test_same_phase_does_not_restart_blinker() {
    configureAndStep(makeConfig(0, 12, 0, -1));

    enterPhase(Phase(Phase::Kind::Wait));   // tick 1
    stepTimes(29);                          // ticks 2..30
    TEST_ASSERT_FALSE(ctrl->leftBlinker().isOn());

    enterPhase(Phase(Phase::Kind::Wait));   // tick 31, not a change
    stepTimes(18);                          // ticks 32..49
    TEST_ASSERT_FALSE(ctrl->leftBlinker().isOn());

    ctrl->step();                           // tick 50: 500 ms elapsed
    TEST_ASSERT_TRUE(ctrl->leftBlinker().isOn());
}

void test_processing_and_print_not_flushed_on_entry() {
    configureAndStep(makeConfig(0, 12, -1, -1));
    enterPhase(Phase(Phase::Kind::Capture));
    MockPixelDevice* dev = mockDevice();
    int shows = dev->showCallCount;
    TEST_ASSERT_EQUAL(1, shows);

    enterPhase(Phase(Phase::Kind::Processing));
    TEST_ASSERT_EQUAL(shows, dev->showCallCount);

    enterPhase(Phase(Phase::Kind::Print));
    TEST_ASSERT_EQUAL(shows, dev->showCallCount);

    // First flush comes with the first rotation (tick 21)
    stepTimes(19);
    TEST_ASSERT_EQUAL(shows, dev->showCallCount);
    ctrl->step();
    TEST_ASSERT_EQUAL(shows + 1, dev->showCallCount);
}

void test_chosen_with_new_count_is_change() {
    configureAndStep(makeConfig(0, 12, -1, -1));

    enterPhase(Phase::chosen(1));
    int shows = mockDevice()->showCallCount;

    enterPhase(Phase::chosen(2));
    TEST_ASSERT_EQUAL(shows + 1, mockDevice()->showCallCount);
    TEST_ASSERT_TRUE(mockDevice()->allPixels(COLOR_RED));
}

// =====================================================
// Button Blinkers
// =====================================================

void test_presets_per_phase() {
    configureAndStep(makeConfig(0, 12, 0, 11));

    enterPhase(Phase(Phase::Kind::Wait));
    TEST_ASSERT_TRUE(ctrl->leftBlinker().isEnabled());
    TEST_ASSERT_FALSE(ctrl->rightBlinker().isEnabled());

    enterPhase(Phase(Phase::Kind::Choose));
    TEST_ASSERT_TRUE(ctrl->leftBlinker().isEnabled());
    TEST_ASSERT_TRUE(ctrl->rightBlinker().isEnabled());
    TEST_ASSERT_EQUAL_UINT32(200, ctrl->leftBlinker().onMs());

    enterPhase(Phase(Phase::Kind::Print));
    TEST_ASSERT_EQUAL_UINT32(200, ctrl->rightBlinker().onMs());
    TEST_ASSERT_EQUAL_UINT32(600, ctrl->rightBlinker().offMs());

    // Capture keeps whatever was set before
    enterPhase(Phase(Phase::Kind::Capture));
    TEST_ASSERT_TRUE(ctrl->rightBlinker().isEnabled());
    TEST_ASSERT_EQUAL_UINT32(600, ctrl->rightBlinker().offMs());

    enterPhase(Phase(Phase::Kind::Finish));
    TEST_ASSERT_FALSE(ctrl->leftBlinker().isEnabled());
    TEST_ASSERT_FALSE(ctrl->rightBlinker().isEnabled());
}

void test_overlay_is_not_kept_in_pixel_memory() {
    configureAndStep(makeConfig(0, 12, 2, -1));
    enterPhase(Phase(Phase::Kind::Wait));

    // Processing keeps the Wait blinkers; the left one
    // restarts and turns on (white) at tick 50
    enterPhase(Phase(Phase::Kind::Processing));   // tick 1
    stepTimes(49);                                 // ticks 2..50
    MockPixelDevice* dev = mockDevice();

    TEST_ASSERT_EQUAL(1, dev->showCallCount);
    TEST_ASSERT_TRUE(dev->shown[2] == COLOR_WHITE);
    TEST_ASSERT_TRUE(dev->pixels[2] == COLOR_BLUE);
    TEST_ASSERT_TRUE(dev->shown[3] == COLOR_RED);

    // Tick 51 rotates the restored color, not the overlay
    ctrl->step();
    TEST_ASSERT_TRUE(dev->pixels[1] == COLOR_BLUE);
}

void test_blinker_toggle_triggers_show() {
    configureAndStep(makeConfig(0, 12, 0, -1));
    enterPhase(Phase(Phase::Kind::Wait));
    enterPhase(Phase(Phase::Kind::Processing));   // tick 1, not flushed
    MockPixelDevice* dev = mockDevice();
    int shows = dev->showCallCount;

    stepTimes(48);                                 // ticks 2..49
    TEST_ASSERT_EQUAL(shows, dev->showCallCount);

    ctrl->step();                                  // tick 50, blinker on
    TEST_ASSERT_EQUAL(shows + 1, dev->showCallCount);
    TEST_ASSERT_TRUE(dev->shown[0] == COLOR_WHITE);
    TEST_ASSERT_TRUE(dev->pixels[0] == COLOR_RED);
}

void test_disabled_blinker_leaves_pixel() {
    configureAndStep(makeConfig(0, 12, -1, 5));

    // Right blinker is disabled in Wait
    enterPhase(Phase(Phase::Kind::Preview));
    enterPhase(Phase(Phase::Kind::Wait));
    stepTimes(10);
    TEST_ASSERT_TRUE(mockDevice()->shown.size() == 12);
    TEST_ASSERT_TRUE(mockDevice()->shown[5] == mockDevice()->pixels[5]);
}

void test_out_of_range_button_is_skipped() {
    configureAndStep(makeConfig(0, 12, 50, 3));

    TEST_ASSERT_EQUAL_INT16(StripConfig::NO_PIXEL, ctrl->activeConfig().leftButtonPixel);
    TEST_ASSERT_EQUAL_INT16(3, ctrl->activeConfig().rightButtonPixel);

    // Still renders normally
    enterPhase(Phase(Phase::Kind::Preview));
    TEST_ASSERT_TRUE(mockDevice()->allPixels(COLOR_WHITE));
}

// =====================================================
// Reconfiguration / Degraded Modes
// =====================================================

void test_reconfigure_reopens_device() {
    configureAndStep(makeConfig(0, 12, -1, -1));
    enterPhase(Phase(Phase::Kind::Wait));

    configureAndStep(makeConfig(0, 20, -1, -1));
    TEST_ASSERT_EQUAL(1, driver->closeCallCount);
    TEST_ASSERT_EQUAL(2, driver->openCallCount);
    TEST_ASSERT_EQUAL_UINT16(20, ctrl->device()->pixelCount());
    TEST_ASSERT_TRUE(ctrl->currentPhase().is(Phase::Kind::None));
    TEST_ASSERT_TRUE(driver->devices[0]->closed);
}

void test_unchanged_config_is_not_queued() {
    configureAndStep(makeConfig(0, 12, -1, -1));

    TEST_ASSERT_FALSE(ctrl->applyConfiguration(makeConfig(0, 12, -1, -1)));
    TEST_ASSERT_EQUAL(0, ctrl->pendingNotifications());
    TEST_ASSERT_EQUAL(1, driver->openCallCount);
}

void test_zero_pixel_count_disables_strip() {
    configureAndStep(makeConfig(0, 0, -1, -1));

    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::Running);
    TEST_ASSERT_EQUAL(0, driver->openCallCount);
    TEST_ASSERT_NULL(ctrl->device());

    ctrl->switchState(Phase(Phase::Kind::Wait));
    TEST_ASSERT_EQUAL_UINT32(LedController::NO_DEVICE_POLL_MS, ctrl->step());
}

void test_no_channel_disables_strip() {
    configureAndStep(makeConfig(StripConfig::NO_CHANNEL, 30, -1, -1));
    TEST_ASSERT_EQUAL(0, driver->openCallCount);
    TEST_ASSERT_NULL(ctrl->device());
}

void test_unavailable_driver() {
    driver->availableResult = false;
    configureAndStep(makeConfig(0, 12, -1, -1));

    TEST_ASSERT_EQUAL(0, driver->openCallCount);
    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::Running);

    ctrl->switchState(Phase(Phase::Kind::Wait));
    TEST_ASSERT_EQUAL_UINT32(LedController::NO_DEVICE_POLL_MS, ctrl->step());
}

void test_open_failure() {
    driver->openResult = false;
    configureAndStep(makeConfig(0, 12, -1, -1));

    TEST_ASSERT_EQUAL(1, driver->openCallCount);
    TEST_ASSERT_NULL(ctrl->device());
    std::string out = platform_native_serial_take_output();
    TEST_ASSERT_TRUE(out.find("\"level\":\"error\"") != std::string::npos);
}

void test_without_driver() {
    LedController bare(nullptr);
    TEST_ASSERT_TRUE(bare.applyConfiguration(makeConfig(0, 12, -1, -1)));
    bare.step();

    TEST_ASSERT_TRUE(bare.runState() == LedController::RunState::Running);
    TEST_ASSERT_NULL(bare.device());
}

void test_degraded_mode_recovers_on_reconfigure() {
    configureAndStep(makeConfig(StripConfig::NO_CHANNEL, 12, -1, -1));
    ctrl->switchState(Phase(Phase::Kind::Wait));
    ctrl->step();

    configureAndStep(makeConfig(0, 12, -1, -1));
    TEST_ASSERT_NOT_NULL(ctrl->device());
}

// =====================================================
// Terminate
// =====================================================

void test_terminate_blanks_and_stops() {
    configureAndStep(makeConfig(0, 12, 0, 11));
    enterPhase(Phase(Phase::Kind::Preview));
    MockPixelDevice* dev = mockDevice();
    dev->resetCounters();

    ctrl->switchState(Phase(Phase::Kind::Terminate));
    TEST_ASSERT_EQUAL_UINT32(0, ctrl->step());

    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::Shutdown);
    TEST_ASSERT_EQUAL(1, dev->fillCallCount);
    TEST_ASSERT_EQUAL(1, dev->showCallCount);
    TEST_ASSERT_TRUE(dev->allPixels(COLOR_BLACK));
    TEST_ASSERT_TRUE(dev->closed);
    TEST_ASSERT_NULL(ctrl->device());
}

void test_nothing_after_terminate() {
    configureAndStep(makeConfig(0, 12, -1, -1));
    enterPhase(Phase(Phase::Kind::Terminate));
    MockPixelDevice* dev = driver->lastDevice();
    dev->resetCounters();

    ctrl->switchState(Phase(Phase::Kind::Wait));
    TEST_ASSERT_EQUAL_UINT32(0, ctrl->step());
    TEST_ASSERT_EQUAL(1, ctrl->pendingNotifications());
    TEST_ASSERT_EQUAL(0, dev->pixelOperationCount());
    TEST_ASSERT_EQUAL(1, driver->openCallCount);
}

void test_terminate_without_device() {
    configureAndStep(makeConfig(0, 0, -1, -1));
    enterPhase(Phase(Phase::Kind::Terminate));
    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::Shutdown);
}

void test_run_returns_after_terminate() {
    ctrl->applyConfiguration(makeConfig(0, 12, -1, -1));
    ctrl->switchState(Phase(Phase::Kind::Wait));
    ctrl->switchState(Phase(Phase::Kind::Terminate));

    uint32_t delayedBefore = platform_native_delayed_ms();
    ctrl->run();

    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::Shutdown);
    TEST_ASSERT_TRUE(driver->lastDevice()->allPixels(COLOR_BLACK));
    // Reconfigure and Wait ticks each waited one tick
    TEST_ASSERT_EQUAL_UINT32(2 * LedController::TICK_MS,
                             platform_native_delayed_ms() - delayedBefore);
}

// =====================================================
// Controller Task
// =====================================================

void test_task_with_concurrent_producers() {
    static const int PRODUCERS = 3;
    static const int PHASES_PER_PRODUCER = 10;
    const StripConfig cfg = makeConfig(0, 12, 0, 11);

    TEST_ASSERT_TRUE(ctrl->start());

    std::atomic<int> configChanges(0);
    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; p++) {
        producers.push_back(std::thread([&configChanges, &cfg, p]() {
            if (ctrl->applyConfiguration(cfg)) {
                configChanges++;
            }
            for (int i = 0; i < PHASES_PER_PRODUCER; i++) {
                if (i % 2 == 0) {
                    ctrl->switchState(Phase(Phase::Kind::Preview));
                } else {
                    ctrl->switchState(Phase::chosen((uint8_t)p));
                }
            }
        }));
    }
    for (size_t i = 0; i < producers.size(); i++) {
        producers[i].join();
    }
    ctrl->switchState(Phase(Phase::Kind::Terminate));

    // The task logs its last line after it stopped touching
    // the controller; only then may it be destroyed
    std::string out;
    bool finished = false;
    for (int waited = 0; waited < 5000 && !finished; waited += 5) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        out += platform_native_serial_take_output();
        finished = out.find("Controller task finished") != std::string::npos;
    }
    if (!finished) {
        // Task may still be running: leak rather than free under it
        ctrl = nullptr;
        driver = nullptr;
        TEST_FAIL_MESSAGE("controller task did not finish");
    }

    TEST_ASSERT_EQUAL(1, configChanges.load());
    TEST_ASSERT_TRUE(ctrl->runState() == LedController::RunState::Shutdown);
    TEST_ASSERT_EQUAL(1, driver->openCallCount);
    TEST_ASSERT_EQUAL(1, driver->closeCallCount);

    MockPixelDevice* dev = driver->lastDevice();
    TEST_ASSERT_NOT_NULL(dev);
    TEST_ASSERT_TRUE(dev->closed);
    TEST_ASSERT_TRUE(dev->allPixels(COLOR_BLACK));
    TEST_ASSERT_EQUAL(1, dev->blackShowCount);
    TEST_ASSERT_EQUAL(0, ctrl->pendingNotifications());
}

// =====================================================
// Test Runner
// =====================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_initial_state);
    RUN_TEST(test_phases_before_config_are_discarded);
    RUN_TEST(test_first_config_opens_device);
    RUN_TEST(test_waiting_stops_at_reconfigure);
    RUN_TEST(test_none_phase_renders_nothing);
    RUN_TEST(test_phase_change_renders_and_shows);
    RUN_TEST(test_one_notification_per_tick);
    RUN_TEST(test_same_phase_does_not_restart_blinker);
    RUN_TEST(test_processing_and_print_not_flushed_on_entry);
    RUN_TEST(test_chosen_with_new_count_is_change);
    RUN_TEST(test_presets_per_phase);
    RUN_TEST(test_overlay_is_not_kept_in_pixel_memory);
    RUN_TEST(test_blinker_toggle_triggers_show);
    RUN_TEST(test_disabled_blinker_leaves_pixel);
    RUN_TEST(test_out_of_range_button_is_skipped);
    RUN_TEST(test_reconfigure_reopens_device);
    RUN_TEST(test_unchanged_config_is_not_queued);
    RUN_TEST(test_zero_pixel_count_disables_strip);
    RUN_TEST(test_no_channel_disables_strip);
    RUN_TEST(test_unavailable_driver);
    RUN_TEST(test_open_failure);
    RUN_TEST(test_without_driver);
    RUN_TEST(test_degraded_mode_recovers_on_reconfigure);
    RUN_TEST(test_terminate_blanks_and_stops);
    RUN_TEST(test_nothing_after_terminate);
    RUN_TEST(test_terminate_without_device);
    RUN_TEST(test_run_returns_after_terminate);
    RUN_TEST(test_task_with_concurrent_producers);

    return UNITY_END();
}
