#include "awlights/effects/EffectOrchestrator.hpp"

#include "awlights/log/Log.hpp"

#include <utility>

namespace awlights::effects {

using core::EffectKind;

namespace {

const log::Channel channel{"EffectOrchestrator"};

void reportFailure(const char* controller, const char* effect, const expected<void>& result) {
    if (!result) {
        channel.error(controller, " ", effect, " failed: ",
                      result.error().message(), "\n");
    }
}

} // namespace

std::vector<core::RgbColor> defaultMultiColors() {
    return {core::RED, core::GREEN, core::BLUE};
}

core::EffectRequest withDefaults(core::EffectRequest request) {
    if (!request.colors.empty()) {
        return request;
    }

    switch (request.kind) {
        case EffectKind::Static:
        case EffectKind::Pulse:
            request.colors = {DEFAULT_SINGLE_COLOR};
            break;
        case EffectKind::Breathe:
        case EffectKind::Morph:
            request.colors = defaultMultiColors();
            break;
        case EffectKind::Spectrum:
        case EffectKind::Wave:
        case EffectKind::Off:
            break; // fixed colours
    }
    return request;
}

std::string describe(const core::EffectRequest& request) {
    const auto effective = withDefaults(request);
    const auto count = std::to_string(effective.colors.size());

    switch (effective.kind) {
        case EffectKind::Static:   return "Static #" + core::toHexString(effective.colors.front());
        case EffectKind::Breathe:  return "Breathing with " + count + " colors";
        case EffectKind::Morph:    return "Morphing with " + count + " colors";
        case EffectKind::Spectrum: return "Spectrum cycle";
        case EffectKind::Wave:     return "Rainbow wave";
        case EffectKind::Pulse:    return "Pulsing #" + core::toHexString(effective.colors.front());
        case EffectKind::Off:      return "Lights off";
    }
    return {};
}

EffectOrchestrator::EffectOrchestrator()
: EffectOrchestrator(&keyboard::KeyboardDevice::create, &elc::ElcDevice::create) {
}

EffectOrchestrator::EffectOrchestrator(KeyboardFactory keyboardFactoryValue,
                                       ElcFactory elcFactoryValue)
: keyboardFactory(std::move(keyboardFactoryValue))
, elcFactory(std::move(elcFactoryValue)) {
}

std::string EffectOrchestrator::run(const core::EffectRequest& request) {
    const auto effective = withDefaults(request);
    const auto& targets = effective.targets;

    std::unique_ptr<keyboard::KeyboardDevice> keyboardDevice;
    if (targets.keyboard && keyboardFactory) {
        keyboardDevice = keyboardFactory();
        if (keyboardDevice && !keyboardDevice->open()) {
            keyboardDevice.reset();
        }
    }

    std::unique_ptr<elc::ElcDevice> elcDevice;
    if (targets.anyTron() && elcFactory) {
        elcDevice = elcFactory();
        if (elcDevice && !elcDevice->open()) {
            elcDevice.reset();
        }
    }

    dispatch(effective, keyboardDevice.get(), elcDevice.get(),
             elc::ZoneTargets{targets.ring, targets.logos});

    if (keyboardDevice) {
        keyboardDevice->close();
    }
    if (elcDevice) {
        elcDevice->close();
    }

    return describe(effective);
}

void EffectOrchestrator::dispatch(const core::EffectRequest& request,
                                  keyboard::KeyboardDevice* keyboardDevice,
                                  elc::ElcDevice* elcDevice,
                                  elc::ZoneTargets zones) {
    const char* effect = core::toString(request.kind);
    const auto& colors = request.colors;

    switch (request.kind) {
        case EffectKind::Static:
            if (keyboardDevice) reportFailure("keyboard", effect, keyboardDevice->staticColor(colors.front()));
            if (elcDevice) reportFailure("AW-ELC", effect, elcDevice->staticColor(colors.front(), zones));
            break;
        case EffectKind::Breathe:
            if (keyboardDevice) reportFailure("keyboard", effect, keyboardDevice->breathe(colors));
            if (elcDevice) reportFailure("AW-ELC", effect, elcDevice->breathe(colors, zones));
            break;
        case EffectKind::Morph:
            if (keyboardDevice) reportFailure("keyboard", effect, keyboardDevice->morph(colors));
            if (elcDevice) reportFailure("AW-ELC", effect, elcDevice->morph(colors, zones));
            break;
        case EffectKind::Spectrum:
            if (keyboardDevice) reportFailure("keyboard", effect, keyboardDevice->spectrum());
            if (elcDevice) reportFailure("AW-ELC", effect, elcDevice->spectrum(zones));
            break;
        case EffectKind::Wave:
            // The ELC has no wave; it cycles the same rainbow as spectrum.
            if (keyboardDevice) reportFailure("keyboard", effect, keyboardDevice->wave());
            if (elcDevice) reportFailure("AW-ELC", effect, elcDevice->spectrum(zones));
            break;
        case EffectKind::Pulse:
            if (keyboardDevice) reportFailure("keyboard", effect, keyboardDevice->pulse(colors.front()));
            if (elcDevice) reportFailure("AW-ELC", effect, elcDevice->pulse(colors.front(), zones));
            break;
        case EffectKind::Off:
            if (keyboardDevice) reportFailure("keyboard", effect, keyboardDevice->off());
            if (elcDevice) reportFailure("AW-ELC", effect, elcDevice->off(zones));
            break;
    }
}

} // namespace awlights::effects
