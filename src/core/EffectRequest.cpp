#include "awlights/core/EffectRequest.hpp"

#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace awlights::core {
namespace {

constexpr std::array<std::pair<EffectKind, const char*>, 7> EFFECT_NAMES{{
    {EffectKind::Static, "static"},
    {EffectKind::Breathe, "breathe"},
    {EffectKind::Morph, "morph"},
    {EffectKind::Spectrum, "spectrum"},
    {EffectKind::Wave, "wave"},
    {EffectKind::Pulse, "pulse"},
    {EffectKind::Off, "off"},
}};

} // namespace

const char* toString(EffectKind kind) {
    for (const auto& [value, name] : EFFECT_NAMES) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<EffectKind> parseEffectKind(std::string_view name) {
    std::string lowered(name);
    for (auto& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (const auto& [value, text] : EFFECT_NAMES) {
        if (lowered == text) {
            return value;
        }
    }
    return std::nullopt;
}

TargetSelection TargetSelection::fromFlags(bool keyboard, bool tron, bool ring, bool logos) {
    if (!keyboard && !tron && !ring && !logos) {
        return TargetSelection{};
    }

    TargetSelection targets;
    targets.keyboard = keyboard;
    targets.ring = tron || ring;
    targets.logos = tron || logos;
    return targets;
}

} // namespace awlights::core
