#include "awlights/elc/ElcDevice.hpp"

#include "awlights/elc/ElcConfig.hpp"
#include "awlights/elc/ElcProtocol.hpp"
#include "awlights/hid/DeviceLocator.hpp"
#include "awlights/log/Log.hpp"

#include <utility>

namespace awlights::elc {

using protocol::AnimationOp;

namespace {
const log::Channel channel{"ElcDevice"};
}

ElcDevice::ElcDevice(std::unique_ptr<hid::ReportSession> session, core::Sleeper sleeper)
: LightingDeviceBase(std::move(session), std::move(sleeper)) {
}

ElcDevice::~ElcDevice() {
    close();
}

std::unique_ptr<ElcDevice> ElcDevice::create() {
    auto session = std::make_unique<hid::OutputReportSession>(
        std::string(config::ELC_IDENTITY.name), config::ELC_REPORT,
        hid::locate(config::ELC_IDENTITY), config::SEND_DELAY);
    return std::make_unique<ElcDevice>(std::move(session));
}

std::vector<std::uint8_t> ElcDevice::ringZones() {
    return {config::RING_ZONES.begin(), config::RING_ZONES.end()};
}

std::vector<std::uint8_t> ElcDevice::logoZones() {
    return {config::LOGO_ZONES.begin(), config::LOGO_ZONES.end()};
}

expected<void> ElcDevice::staticColor(const core::RgbColor& color, ZoneTargets targets) {
    return apply(protocol::staticAction(color), targets);
}

expected<void> ElcDevice::breathe(const std::vector<core::RgbColor>& colors, ZoneTargets targets) {
    if (colors.empty()) {
        return fail(std::errc::invalid_argument);
    }
    return apply(protocol::morphAction(colors), targets);
}

expected<void> ElcDevice::morph(const std::vector<core::RgbColor>& colors, ZoneTargets targets) {
    return breathe(colors, targets);
}

expected<void> ElcDevice::spectrum(ZoneTargets targets) {
    return breathe({core::RED, core::GREEN, core::BLUE}, targets);
}

expected<void> ElcDevice::pulse(const core::RgbColor& color, ZoneTargets targets) {
    return apply(protocol::pulseAction(color), targets);
}

expected<void> ElcDevice::off(ZoneTargets targets) {
    return staticColor(core::BLACK, targets);
}

expected<void> ElcDevice::setRing(const core::ByteBuffer& action,
                                  const std::vector<std::uint8_t>& zones) {
    const core::ByteBuffer sequence[] = {
        protocol::userAnimationCommand(AnimationOp::Remove),
        protocol::userAnimationCommand(AnimationOp::Start),
        protocol::selectZonesCommand(zones),
        protocol::addActionCommand(action),
        protocol::userAnimationCommand(AnimationOp::Play),
    };

    for (const auto& payload : sequence) {
        if (auto r = send(payload); !r) {
            channel.error("ring programming failed: ", r.error().message(), "\n");
            return r;
        }
    }
    return {};
}

expected<void> ElcDevice::setLogos(const core::ByteBuffer& action,
                                   const std::vector<std::uint8_t>& zones) {
    expected<void> result;
    const auto track = [&result](expected<void> r) {
        if (!r && result) {
            result = std::move(r);
        }
    };

    track(send(protocol::userAnimationCommand(AnimationOp::Play)));
    pause(config::LOGO_SETTLE_DELAY);

    const auto select = protocol::selectZonesCommand(zones);
    const auto addAction = protocol::addActionCommand(action);

    for (const auto state : protocol::POWER_STATES) {
        track(send(protocol::powerAnimationCommand(AnimationOp::Remove, state)));
        track(send(protocol::powerAnimationCommand(AnimationOp::Start, state)));
        track(send(select));
        track(send(addAction));
        track(send(protocol::powerAnimationCommand(AnimationOp::Save, state)));
    }

    track(send(protocol::userAnimationCommand(AnimationOp::PlayAll)));

    if (!result) {
        channel.error("logo programming incomplete: ", result.error().message(), "\n");
    }
    return result;
}

expected<void> ElcDevice::apply(const core::ByteBuffer& action, ZoneTargets targets) {
    if (!isOpen()) {
        return fail(std::errc::not_connected);
    }

    if (targets.ring) {
        if (auto r = setRing(action); !r) {
            return r;
        }
    }
    if (targets.logos) {
        return setLogos(action);
    }
    return {};
}

} // namespace awlights::elc
