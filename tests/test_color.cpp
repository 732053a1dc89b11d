#include "TestSupport.hpp"

#include "awlights/core/EffectRequest.hpp"
#include "awlights/core/RgbColor.hpp"
#include "awlights/effects/EffectOrchestrator.hpp"

using namespace awlights;
using core::RgbColor;

static void testParseColor() {
    auto pink = core::parseColor("FF1493");
    ASSERT_TRUE(pink.has_value(), "FF1493 parses");
    ASSERT_TRUE(*pink == (RgbColor{255, 20, 147}), "FF1493 is (255, 20, 147)");

    auto green = core::parseColor("#00ff00");
    ASSERT_TRUE(green.has_value(), "#00ff00 parses");
    ASSERT_TRUE(*green == (RgbColor{0, 255, 0}), "#00ff00 is (0, 255, 0)");

    auto mixed = core::parseColor("aBcDeF");
    ASSERT_TRUE(mixed && *mixed == (RgbColor{0xAB, 0xCD, 0xEF}), "mixed case accepted");
}

static void testRejectMalformedColor() {
    const char* bad[] = {"", "#", "FFF", "FF14930", "GG1493", "#FF149", "FF 493", "##FF1493"};
    for (const char* text : bad) {
        auto parsed = core::parseColor(text);
        ASSERT_TRUE(!parsed, text);
        if (!parsed) {
            ASSERT_TRUE(parsed.error() == std::errc::invalid_argument, "invalid_argument reported");
        }
    }
}

static void testToHexString() {
    ASSERT_TRUE(core::toHexString(RgbColor{255, 20, 147}) == "FF1493", "upper-case hex");
    ASSERT_TRUE(core::toHexString(core::BLACK) == "000000", "zero padded");
}

static void testParseEffectKind() {
    ASSERT_TRUE(core::parseEffectKind("static") == core::EffectKind::Static, "static");
    ASSERT_TRUE(core::parseEffectKind("BREATHE") == core::EffectKind::Breathe, "case-insensitive");
    ASSERT_TRUE(core::parseEffectKind("wave") == core::EffectKind::Wave, "wave");
    ASSERT_TRUE(core::parseEffectKind("off") == core::EffectKind::Off, "off");
    ASSERT_TRUE(!core::parseEffectKind("rainbow"), "unknown command rejected");
    ASSERT_TRUE(std::string(core::toString(core::EffectKind::Pulse)) == "pulse", "pulse name");
}

static void testTargetFlags() {
    auto all = core::TargetSelection::fromFlags(false, false, false, false);
    ASSERT_TRUE(all.keyboard && all.ring && all.logos, "no flag selects everything");

    auto keyboardOnly = core::TargetSelection::fromFlags(true, false, false, false);
    ASSERT_TRUE(keyboardOnly.keyboard && !keyboardOnly.anyTron(), "--keyboard");

    auto tron = core::TargetSelection::fromFlags(false, true, false, false);
    ASSERT_TRUE(!tron.keyboard && tron.ring && tron.logos, "--tron is ring and logos");

    auto ringOnly = core::TargetSelection::fromFlags(false, false, true, false);
    ASSERT_TRUE(!ringOnly.keyboard && ringOnly.ring && !ringOnly.logos, "--ring");

    auto mixed = core::TargetSelection::fromFlags(true, false, false, true);
    ASSERT_TRUE(mixed.keyboard && !mixed.ring && mixed.logos, "--keyboard --logos");
}

static void testDefaultsAndSummary() {
    core::EffectRequest request;
    request.kind = core::EffectKind::Static;
    auto filled = effects::withDefaults(request);
    ASSERT_EQ(filled.colors.size(), std::size_t{1}, "static default has one colour");
    ASSERT_TRUE(filled.colors.front() == effects::DEFAULT_SINGLE_COLOR, "static default is FF1493");
    ASSERT_TRUE(effects::describe(request) == "Static #FF1493", "static summary");

    request.kind = core::EffectKind::Breathe;
    ASSERT_EQ(effects::withDefaults(request).colors.size(), std::size_t{3}, "breathe default RGB");
    ASSERT_TRUE(effects::describe(request) == "Breathing with 3 colors", "breathe summary");

    request.kind = core::EffectKind::Morph;
    request.colors = {core::RED, core::BLUE};
    ASSERT_TRUE(effects::describe(request) == "Morphing with 2 colors", "morph summary keeps caller colours");

    request.kind = core::EffectKind::Pulse;
    request.colors = {RgbColor{0x12, 0x34, 0x56}};
    ASSERT_TRUE(effects::describe(request) == "Pulsing #123456", "pulse summary");

    request.colors.clear();
    request.kind = core::EffectKind::Spectrum;
    ASSERT_TRUE(effects::describe(request) == "Spectrum cycle", "spectrum summary");
    request.kind = core::EffectKind::Wave;
    ASSERT_TRUE(effects::describe(request) == "Rainbow wave", "wave summary");
    request.kind = core::EffectKind::Off;
    ASSERT_TRUE(effects::describe(request) == "Lights off", "off summary");
}

int main() {
    testParseColor();
    testRejectMalformedColor();
    testToHexString();
    testParseEffectKind();
    testTargetFlags();
    testDefaultsAndSummary();
    return awtest::finish("Color and request");
}
