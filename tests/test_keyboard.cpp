#include "TestSupport.hpp"

#include "awlights/core/SystemConfig.hpp"
#include "awlights/keyboard/KeyboardConfig.hpp"
#include "awlights/keyboard/KeyboardDevice.hpp"
#include "awlights/keyboard/KeyboardProtocol.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

using namespace awlights;
using awtest::Bytes;
using awtest::RecordingSession;
using awtest::Transcript;
using core::RgbColor;
using namespace std::chrono_literals;

namespace {

const Bytes RESET = {0x94};
const Bytes DISABLE_EFFECT = {0x80, 0x01, 0xFE, 0x00, 0x00, 0x01, 0x01, 0x01};
const Bytes COMMIT_KEYS = {0x8C, 0x13};
const Bytes COMMIT = {0x8B, 0x01, 0xFF};

struct Rig {
    Transcript transcript;
    RecordingSession* session = nullptr;
    int rebinds = 0;
    std::string reboundBusId;
    std::unique_ptr<keyboard::KeyboardDevice> device;

    explicit Rig(std::optional<std::string> devicePath = std::nullopt, bool present = true) {
        auto recording = std::make_unique<RecordingSession>(transcript, present);
        session = recording.get();
        device = std::make_unique<keyboard::KeyboardDevice>(
            std::move(recording), std::move(devicePath), transcript.sleeper(),
            [this](const std::string& busId) -> expected<void> {
                ++rebinds;
                reboundBusId = busId;
                return {};
            });
    }
};

bool startsWithResetAndDisable(const std::vector<Bytes>& sends) {
    return sends.size() >= 2 && sends[0] == RESET && sends[1] == DISABLE_EFFECT;
}

Bytes effectCommand(std::uint8_t type, std::uint8_t tempo, const std::vector<RgbColor>& colors) {
    Bytes bytes = {0x80, type, tempo, 0x00, 0x00, 0x01, 0x01, 0x01,
                   static_cast<std::uint8_t>(colors.size() - 1)};
    for (const auto& c : colors) {
        bytes.push_back(c.red);
        bytes.push_back(c.green);
        bytes.push_back(c.blue);
    }
    return bytes;
}

} // namespace

static void testPayloadBuilders() {
    ASSERT_TRUE(keyboard::protocol::resetCommand().bytes() == RESET, "reset payload");
    ASSERT_TRUE(keyboard::protocol::disableEffectCommand().bytes() == DISABLE_EFFECT, "disable payload");
    ASSERT_TRUE(keyboard::protocol::commitKeysCommand().bytes() == COMMIT_KEYS, "commit keys payload");
    ASSERT_TRUE(keyboard::protocol::commitCommand().bytes() == COMMIT, "commit payload");

    auto chunk = keyboard::protocol::keyChunkCommand(0, 2, RgbColor{1, 2, 3});
    const Bytes expectedChunk = {0x8C, 0x02, 0x00, 0x01, 1, 2, 3, 0x02, 1, 2, 3};
    ASSERT_TRUE(chunk.bytes() == expectedChunk, "key indices are 1-based on the wire");

    auto full = keyboard::protocol::globalEffectCommand(
        keyboard::protocol::EffectType::Wave, 0x05,
        std::vector<RgbColor>(keyboard::protocol::MAX_EFFECT_COLORS, core::RED));
    ASSERT_TRUE(full.has_value(), "18 colours fit");
    if (full) {
        ASSERT_EQ(full->size(), std::size_t{63}, "18 colours fill the payload exactly");
    }

    auto tooMany = keyboard::protocol::globalEffectCommand(
        keyboard::protocol::EffectType::Wave, 0x05,
        std::vector<RgbColor>(keyboard::protocol::MAX_EFFECT_COLORS + 1, core::RED));
    ASSERT_TRUE(!tooMany, "19 colours rejected");

    auto none = keyboard::protocol::globalEffectCommand(
        keyboard::protocol::EffectType::Morph, 0x07, {});
    ASSERT_TRUE(!none, "empty colour list rejected");
}

static void testStaticSequence() {
    Rig rig;
    ASSERT_TRUE(rig.device->open(), "open recording session");
    ASSERT_TRUE(rig.device->staticColor(RgbColor{0xFF, 0x14, 0x93}).has_value(), "static succeeds");

    const auto sends = rig.transcript.sends();
    ASSERT_TRUE(startsWithResetAndDisable(sends), "static starts with reset and disable");

    // 0x88 keys in chunks of 15: nine full chunks and one of 1.
    ASSERT_EQ(sends.size(), std::size_t{2 + 10 + 2}, "reset, disable, 10 chunks, commit keys, commit");

    std::size_t keysSeen = 0;
    for (std::size_t i = 2; i < 12; ++i) {
        const auto& chunk = sends[i];
        const std::size_t chunkSize = i < 11 ? 15 : 1;
        ASSERT_EQ(chunk.size(), 3 + 4 * chunkSize, "chunk length is 3 + 4 * keys");
        ASSERT_EQ(chunk[0], std::uint8_t{0x8C}, "chunk opcode");
        ASSERT_EQ(chunk[1], std::uint8_t{0x02}, "chunk subcommand");
        ASSERT_EQ(chunk[3], static_cast<std::uint8_t>(keysSeen + 1), "first key of chunk");
        ASSERT_EQ(chunk[4], std::uint8_t{0xFF}, "red");
        ASSERT_EQ(chunk[5], std::uint8_t{0x14}, "green");
        ASSERT_EQ(chunk[6], std::uint8_t{0x93}, "blue");
        keysSeen += chunkSize;
    }
    ASSERT_EQ(keysSeen, keyboard::config::KEYBOARD_KEY_COUNT, "every key programmed once");
    ASSERT_EQ(sends[11][3], std::uint8_t{0x88}, "last key is 0x88 on the wire");
    ASSERT_TRUE(sends[12] == COMMIT_KEYS, "commit keys marker");
    ASSERT_TRUE(sends[13] == COMMIT, "final commit");
}

static void testStaticTiming() {
    Rig rig;
    rig.device->open();
    rig.device->staticColor(core::RED);

    const auto& entries = rig.transcript.entries;
    ASSERT_TRUE(entries.size() >= 4, "transcript populated");
    ASSERT_TRUE(!entries[0].isPause && entries[0].payload == RESET, "reset first");
    ASSERT_TRUE(entries[1].isPause && entries[1].pause == 50ms, "50ms after reset");
    ASSERT_TRUE(!entries[2].isPause && entries[2].payload == DISABLE_EFFECT, "disable second");
    ASSERT_TRUE(entries[3].isPause && entries[3].pause == 50ms, "50ms after disable");

    int chunkPauses = 0;
    for (const auto& e : entries) {
        if (e.isPause && e.pause == 10ms) ++chunkPauses;
    }
    ASSERT_EQ(chunkPauses, 11, "10ms after each chunk and after commit keys");
    ASSERT_TRUE(!entries.back().isPause && entries.back().payload == COMMIT, "commit is last, no pause");
}

static void testGlobalEffects() {
    const std::vector<RgbColor> rainbow = {core::RED, core::GREEN, core::BLUE};
    const RgbColor pink{0xFF, 0x14, 0x93};

    struct Case {
        const char* name;
        std::function<expected<void>(keyboard::KeyboardDevice&)> run;
        Bytes payload;
    };
    const Case cases[] = {
        {"breathe", [&](auto& d) { return d.breathe({pink, core::BLUE}); },
         effectCommand(0x02, 0x07, {pink, core::BLUE})},
        {"morph", [&](auto& d) { return d.morph(rainbow); }, effectCommand(0x02, 0x05, rainbow)},
        {"spectrum", [&](auto& d) { return d.spectrum(); }, effectCommand(0x02, 0x05, rainbow)},
        {"wave", [&](auto& d) { return d.wave(); }, effectCommand(0x03, 0x05, rainbow)},
        {"pulse", [&](auto& d) { return d.pulse(pink); }, effectCommand(0x08, 0x07, {pink})},
    };

    for (const auto& c : cases) {
        Rig rig;
        rig.device->open();
        ASSERT_TRUE(c.run(*rig.device).has_value(), c.name);
        const auto sends = rig.transcript.sends();
        ASSERT_TRUE(startsWithResetAndDisable(sends), c.name);
        ASSERT_EQ(sends.size(), std::size_t{4}, c.name);
        if (sends.size() == 4) {
            ASSERT_TRUE(sends[2] == c.payload, c.name);
            ASSERT_TRUE(sends[3] == COMMIT, c.name);
        }

        const auto& entries = rig.transcript.entries;
        ASSERT_TRUE(entries.size() >= 6 && entries[5].isPause && entries[5].pause == 50ms,
                    "50ms after the effect command");
    }
}

static void testBreatheKeepsAllColors() {
    Rig rig;
    rig.device->open();
    const std::vector<RgbColor> four = {core::RED, core::GREEN, core::BLUE, RgbColor{1, 1, 1}};
    ASSERT_TRUE(rig.device->breathe(four).has_value(), "breathe with four colours");
    const auto sends = rig.transcript.sends();
    ASSERT_TRUE(sends.size() == 4 && sends[2][8] == 3, "colour count byte reflects all four colours");
    ASSERT_TRUE(sends.size() == 4 && sends[2].size() == 9 + 12, "four colours encoded");
}

static void testOffIsStaticBlack() {
    Rig off;
    off.device->open();
    off.device->off();

    Rig black;
    black.device->open();
    black.device->staticColor(core::BLACK);

    ASSERT_TRUE(off.transcript.sends() == black.transcript.sends(), "off equals static black");
}

static void testFailureAbortsSequence() {
    Rig rig;
    rig.device->open();
    rig.session->failOnSend = 3; // first key chunk
    auto result = rig.device->staticColor(core::RED);
    ASSERT_TRUE(!result, "failure surfaces");
    ASSERT_EQ(rig.transcript.sends().size(), std::size_t{2}, "nothing sent after the failure");

    Rig unopened;
    auto notOpen = unopened.device->staticColor(core::RED);
    ASSERT_TRUE(!notOpen && notOpen.error() == std::errc::not_connected, "closed session rejected");
    ASSERT_TRUE(unopened.transcript.entries.empty(), "nothing sent when closed");
}

static void testRebindOnClose() {
    awtest::TempDir sysfs;
    sysfs.writeFile("class/hidraw/hidraw3/device/uevent",
                    "DRIVER=hid-generic\nHID_ID=0003:00000D62:0000BABC\n"
                    "HID_NAME=Darfon Keyboard\nHID_PHYS=usb-0000:00:14.0-8/input0\n");
    core::SystemConfig::Settings settings;
    settings.sysfsRoot = sysfs.path().string();
    core::SystemConfig::ScopedOverride scoped(settings);

    {
        Rig rig("/dev/hidraw3");
        rig.device->open();
        rig.device->close();
        ASSERT_EQ(rig.rebinds, 1, "rebind runs even without any command");
        ASSERT_TRUE(rig.reboundBusId == "usb-0000:00:14.0-8", "bus id cut at the first slash");
        ASSERT_EQ(rig.transcript.closes, 1, "session closed");

        rig.device->close();
        ASSERT_EQ(rig.rebinds, 1, "second close is a no-op");
    }

    {
        Rig rig("/dev/hidraw3");
        rig.device->open();
        rig.session->failOnSend = 1;
        rig.device->pulse(core::RED);
        rig.device.reset();
        ASSERT_EQ(rig.rebinds, 1, "destruction after a failed effect still rebinds");
    }

    {
        Rig rig("/dev/hidraw3", false);
        ASSERT_TRUE(!rig.device->open(), "absent controller does not open");
        rig.device->close();
        ASSERT_EQ(rig.rebinds, 0, "no rebind for a session that never opened");
    }

    {
        Rig rig("/dev/hidraw9");
        rig.device->open();
        rig.device->close();
        ASSERT_EQ(rig.rebinds, 0, "missing descriptor skips the rebind");
    }
}

int main() {
    testPayloadBuilders();
    testStaticSequence();
    testStaticTiming();
    testGlobalEffects();
    testBreatheKeepsAllColors();
    testOffIsStaticBlack();
    testFailureAbortsSequence();
    testRebindOnClose();
    return awtest::finish("Keyboard");
}
