#pragma once

#include "awlights/core/Expected.hpp"
#include "awlights/core/LightingDeviceBase.hpp"
#include "awlights/core/RgbColor.hpp"
#include "awlights/keyboard/KeyboardProtocol.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace awlights::keyboard {

/**
 * @brief Per-key keyboard controller.
 *
 * Every effect runs the same sequence: reset, disable the running effect,
 * program (per-key colours or one global effect), commit. A failed send
 * aborts the sequence and is returned to the caller.
 *
 * Talking to the controller through hidraw leaves the keyboard without its
 * usbhid binding, so close() rebinds the driver whenever the session was
 * opened, whether or not an effect was sent.
 */
class KeyboardDevice : public core::LightingDeviceBase {
public:
    /// Receives the physical bus id read from the node's descriptor.
    using DriverRebinder = std::function<expected<void>(const std::string&)>;

    /**
     * @param session   Transport to the controller.
     * @param devicePath hidraw node the session talks to; used to find the
     *                   bus id for the rebind. std::nullopt skips the rebind.
     * @param sleeper   Inter-command waits.
     * @param rebinder  Defaults to hid::rebindGenericDriver().
     */
    KeyboardDevice(std::unique_ptr<hid::ReportSession> session,
                   std::optional<std::string> devicePath,
                   core::Sleeper sleeper = core::defaultSleeper(),
                   DriverRebinder rebinder = {});
    ~KeyboardDevice() override;

    /// Locate the controller and build a feature-report session for it.
    static std::unique_ptr<KeyboardDevice> create();

    expected<void> staticColor(const core::RgbColor& color);
    expected<void> breathe(const std::vector<core::RgbColor>& colors);
    expected<void> morph(const std::vector<core::RgbColor>& colors);
    expected<void> spectrum();
    expected<void> wave();
    expected<void> pulse(const core::RgbColor& color);
    expected<void> off();

    /// Close the session, then rebind usbhid. Runs once; later calls do nothing.
    void close() override;

private:
    using Program = std::function<expected<void>()>;

    expected<void> runSequence(const Program& program);
    expected<void> reset();
    expected<void> disableEffect();
    expected<void> setAllKeys(const core::RgbColor& color);
    expected<void> globalEffect(protocol::EffectType type, std::uint8_t tempo,
                                const std::vector<core::RgbColor>& colors);
    expected<void> commit();
    void recoverDriver();

    std::optional<std::string> devicePath;
    DriverRebinder rebinder;
    bool closed = false;
};

} // namespace awlights::keyboard
