#include "colourlink/core/Color.hpp"
#include "colourlink/log/Log.hpp"

#include <cstdint>

using namespace colourlink::core;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { colourlink::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { colourlink::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static void testTenBitToEight() {
    const Color c = Color::fromComponents(512, 0, 1023, 10);
    const Color eight = c.toEightBit();
    ASSERT_EQ(eight.red, Channel{128}, "512 of 1023 rounds to 128");
    ASSERT_EQ(eight.green, Channel{0}, "zero stays zero");
    ASSERT_EQ(eight.blue, Channel{255}, "full scale maps to 255");
    ASSERT_EQ(eight.depthBits, std::uint8_t{8}, "result is 8-bit");
}

static void testEightBitIsIdentity() {
    for (Channel v = 0; v <= 255; ++v) {
        ASSERT_EQ(Color::scaleToEightBit(v, 8), static_cast<std::uint8_t>(v), "8-bit identity");
    }
}

static void testZeroDepthTreatedAsEight() {
    ASSERT_EQ(Color::scaleToEightBit(100, 0), std::uint8_t{100}, "depth 0 behaves as 8");
    ASSERT_EQ(Color::fromComponents(1, 1, 1, 0).maxValue(), std::uint64_t{255}, "depth 0 max is 255");
}

static void testSixteenAndTwelveBit() {
    ASSERT_EQ(Color::scaleToEightBit(65535, 16), std::uint8_t{255}, "16-bit full scale");
    ASSERT_EQ(Color::scaleToEightBit(32768, 16), std::uint8_t{128}, "16-bit midpoint rounds up");
    ASSERT_EQ(Color::scaleToEightBit(2048, 12), std::uint8_t{128}, "12-bit midpoint");
    ASSERT_EQ(Color::fromComponents(0, 0, 0, 12).maxValue(), std::uint64_t{4095}, "12-bit max");
}

static void testOutOfRangeClamps() {
    ASSERT_EQ(Color::scaleToEightBit(300, 8), std::uint8_t{255}, "over-range 8-bit value clamps");
    ASSERT_EQ(Color::scaleToEightBit(5000, 10), std::uint8_t{255}, "over-range 10-bit value clamps");
}

int main() {
    testTenBitToEight();
    testEightBitIsIdentity();
    testZeroDepthTreatedAsEight();
    testSixteenAndTwelveBit();
    testOutOfRangeClamps();

    if (g_failures) {
        colourlink::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    colourlink::logInfo("Color tests passed.\n");
    return 0;
}
