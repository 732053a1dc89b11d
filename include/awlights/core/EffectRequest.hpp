#pragma once

#include "awlights/core/RgbColor.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace awlights::core {

enum class EffectKind : std::uint8_t {
    Static,
    Breathe,
    Morph,
    Spectrum,
    Wave,
    Pulse,
    Off
};

/// Command-line name of an effect ("static", "breathe", ...).
const char* toString(EffectKind kind);

/// Case-insensitive lookup of a command-line effect name.
std::optional<EffectKind> parseEffectKind(std::string_view name);

/**
 * @brief Zone groups an effect is sent to.
 *
 * The keyboard lives on one controller; ring and logos share the other.
 */
struct TargetSelection {
    bool keyboard = true;
    bool ring = true;
    bool logos = true;

    bool anyTron() const { return ring || logos; }

    /**
     * @brief Resolve the command-line target flags.
     *
     * --tron selects ring and logos. With no flag at all every zone group is
     * selected.
     */
    static TargetSelection fromFlags(bool keyboard, bool tron, bool ring, bool logos);
};

/**
 * @brief One validated lighting request.
 *
 * An empty colour list means "use the effect's defaults".
 */
struct EffectRequest {
    EffectKind kind = EffectKind::Static;
    std::vector<RgbColor> colors;
    TargetSelection targets;
};

} // namespace awlights::core
