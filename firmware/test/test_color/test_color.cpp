// =====================================================
// Color Unit Tests
// =====================================================
// HSV conversion and named colors.
// =====================================================

#include <unity.h>
#include "color.h"

void setUp() {}

void tearDown() {}

static void assertRgb(uint8_t r, uint8_t g, uint8_t b, Rgb actual) {
    TEST_ASSERT_EQUAL_UINT8(r, actual.r);
    TEST_ASSERT_EQUAL_UINT8(g, actual.g);
    TEST_ASSERT_EQUAL_UINT8(b, actual.b);
}

// =====================================================
// HSV -> RGB
// =====================================================

void test_hsv_primary_hues() {
    assertRgb(255, 0, 0, hsvToRgb(0.0f));
    assertRgb(0, 255, 0, hsvToRgb(1.0f / 3.0f));
    assertRgb(0, 0, 255, hsvToRgb(2.0f / 3.0f));
}

void test_hsv_secondary_hues() {
    assertRgb(255, 255, 0, hsvToRgb(1.0f / 6.0f));
    assertRgb(0, 255, 255, hsvToRgb(0.5f));
    assertRgb(255, 0, 255, hsvToRgb(5.0f / 6.0f));
}

void test_hsv_hue_wraps() {
    // 1.25 is the same hue as 0.25
    Rgb wrapped = hsvToRgb(1.25f);
    Rgb direct = hsvToRgb(0.25f);
    TEST_ASSERT_TRUE(wrapped == direct);
    assertRgb(255, 0, 0, hsvToRgb(1.0f));
}

void test_hsv_zero_saturation_is_grey() {
    assertRgb(128, 128, 128, hsvToRgb(0.3f, 0.0f, 0.5f));
    assertRgb(255, 255, 255, hsvToRgb(0.7f, 0.0f, 1.0f));
}

void test_hsv_zero_value_is_black() {
    assertRgb(0, 0, 0, hsvToRgb(0.4f, 1.0f, 0.0f));
}

void test_hsv_rounds_channels() {
    // v = 0.5 -> 127.5 rounds up
    assertRgb(128, 0, 0, hsvToRgb(0.0f, 1.0f, 0.5f));
    // half saturation: p = 0.5 -> 128
    assertRgb(255, 128, 128, hsvToRgb(0.0f, 0.5f, 1.0f));
}

void test_named_colors() {
    assertRgb(0xFF, 0xD7, 0x00, COLOR_GOLD);
    assertRgb(0x00, 0x40, 0x40, COLOR_DARK_TEAL);
    TEST_ASSERT_TRUE(COLOR_RED != COLOR_GREEN);
}

// =====================================================
// Test Runner
// =====================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_hsv_primary_hues);
    RUN_TEST(test_hsv_secondary_hues);
    RUN_TEST(test_hsv_hue_wraps);
    RUN_TEST(test_hsv_zero_saturation_is_grey);
    RUN_TEST(test_hsv_zero_value_is_black);
    RUN_TEST(test_hsv_rounds_channels);
    RUN_TEST(test_named_colors);

    return UNITY_END();
}
