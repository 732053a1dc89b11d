/**
 * @brief Effect sequences and driver recovery for the per-key keyboard controller.
 */
#include "awlights/keyboard/KeyboardDevice.hpp"

#include "awlights/hid/DeviceLocator.hpp"
#include "awlights/hid/DriverRebind.hpp"
#include "awlights/keyboard/KeyboardConfig.hpp"
#include "awlights/log/Log.hpp"

#include <algorithm>
#include <utility>

namespace awlights::keyboard {

namespace {
const log::Channel channel{"KeyboardDevice"};
const std::vector<core::RgbColor> RAINBOW = {core::RED, core::GREEN, core::BLUE};
}

KeyboardDevice::KeyboardDevice(std::unique_ptr<hid::ReportSession> session,
                               std::optional<std::string> path,
                               core::Sleeper sleeper,
                               DriverRebinder rebinderValue)
: LightingDeviceBase(std::move(session), std::move(sleeper))
, devicePath(std::move(path))
, rebinder(std::move(rebinderValue)) {
    if (!rebinder) {
        rebinder = [this](const std::string& physicalBusId) {
            return hid::rebindGenericDriver(physicalBusId, this->sleeper);
        };
    }
}

KeyboardDevice::~KeyboardDevice() {
    close();
}

std::unique_ptr<KeyboardDevice> KeyboardDevice::create() {
    auto path = hid::locate(config::KEYBOARD_IDENTITY);
    auto session = std::make_unique<hid::FeatureReportSession>(
        std::string(config::KEYBOARD_IDENTITY.name), config::KEYBOARD_REPORT, path);
    return std::make_unique<KeyboardDevice>(std::move(session), std::move(path));
}

expected<void> KeyboardDevice::staticColor(const core::RgbColor& color) {
    return runSequence([&] { return setAllKeys(color); });
}

expected<void> KeyboardDevice::breathe(const std::vector<core::RgbColor>& colors) {
    return runSequence([&] {
        return globalEffect(protocol::EffectType::Morph, config::TEMPO_SLOW, colors);
    });
}

expected<void> KeyboardDevice::morph(const std::vector<core::RgbColor>& colors) {
    return runSequence([&] {
        return globalEffect(protocol::EffectType::Morph, config::TEMPO_FAST, colors);
    });
}

expected<void> KeyboardDevice::spectrum() {
    return runSequence([&] {
        return globalEffect(protocol::EffectType::Morph, config::TEMPO_FAST, RAINBOW);
    });
}

expected<void> KeyboardDevice::wave() {
    return runSequence([&] {
        return globalEffect(protocol::EffectType::Wave, config::TEMPO_FAST, RAINBOW);
    });
}

expected<void> KeyboardDevice::pulse(const core::RgbColor& color) {
    return runSequence([&] {
        return globalEffect(protocol::EffectType::Pulse, config::TEMPO_SLOW, {color});
    });
}

expected<void> KeyboardDevice::off() {
    return staticColor(core::BLACK);
}

void KeyboardDevice::close() {
    if (closed) {
        return;
    }
    closed = true;

    const bool wasOpen = isOpen();
    LightingDeviceBase::close();

    if (wasOpen) {
        recoverDriver();
    }
}

expected<void> KeyboardDevice::runSequence(const Program& program) {
    if (!isOpen()) {
        return fail(std::errc::not_connected);
    }

    if (auto r = reset(); !r) return r;
    if (auto r = disableEffect(); !r) return r;
    if (auto r = program(); !r) return r;
    return commit();
}

expected<void> KeyboardDevice::reset() {
    if (auto r = send(protocol::resetCommand()); !r) {
        return r;
    }
    pause(config::RESET_DELAY);
    return {};
}

expected<void> KeyboardDevice::disableEffect() {
    if (auto r = send(protocol::disableEffectCommand()); !r) {
        return r;
    }
    pause(config::DISABLE_EFFECT_DELAY);
    return {};
}

expected<void> KeyboardDevice::setAllKeys(const core::RgbColor& color) {
    for (std::size_t first = 0; first < config::KEYBOARD_KEY_COUNT;
         first += config::KEYS_PER_CHUNK) {
        const auto count = std::min(config::KEYS_PER_CHUNK,
                                    config::KEYBOARD_KEY_COUNT - first);
        if (auto r = send(protocol::keyChunkCommand(first, count, color)); !r) {
            return r;
        }
        pause(config::KEY_CHUNK_DELAY);
    }

    if (auto r = send(protocol::commitKeysCommand()); !r) {
        return r;
    }
    pause(config::KEY_CHUNK_DELAY);
    return {};
}

expected<void> KeyboardDevice::globalEffect(protocol::EffectType type, std::uint8_t tempo,
                                            const std::vector<core::RgbColor>& colors) {
    auto command = protocol::globalEffectCommand(type, tempo, colors);
    if (!command) {
        channel.error("cannot encode effect with ", colors.size(),
                      " colors (1 to ", protocol::MAX_EFFECT_COLORS, " supported)\n");
        return unexpected(command.error());
    }
    if (auto r = send(*command); !r) {
        return r;
    }
    pause(config::GLOBAL_EFFECT_DELAY);
    return {};
}

expected<void> KeyboardDevice::commit() {
    return send(protocol::commitCommand());
}

void KeyboardDevice::recoverDriver() {
    if (!devicePath) {
        return;
    }
    auto physicalBusId = hid::readPhysicalBusId(*devicePath);
    if (!physicalBusId) {
        return;
    }

    if (auto r = rebinder(*physicalBusId); !r) {
        channel.info("usbhid rebind abandoned for ", *physicalBusId,
                     ": ", r.error().message(), "\n");
    }
}

} // namespace awlights::keyboard
