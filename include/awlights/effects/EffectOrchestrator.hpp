#pragma once

#include "awlights/core/EffectRequest.hpp"
#include "awlights/core/RgbColor.hpp"
#include "awlights/elc/ElcDevice.hpp"
#include "awlights/keyboard/KeyboardDevice.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace awlights::effects {

/// Default colour of static and pulse when none is given (#FF1493).
constexpr core::RgbColor DEFAULT_SINGLE_COLOR{0xFF, 0x14, 0x93};

/// Default colours of breathe and morph when none are given.
std::vector<core::RgbColor> defaultMultiColors();

/**
 * @brief Runs one EffectRequest against whichever controllers are present.
 *
 * Only the controllers the request targets are created and opened. A
 * controller that cannot be found or opened is left out for the rest of the
 * run; the session has already warned about it. Encoding failures are logged
 * and never abort the other controller. Both devices are closed before run()
 * returns, so the keyboard always gets its driver rebind.
 */
class EffectOrchestrator {
public:
    using KeyboardFactory = std::function<std::unique_ptr<keyboard::KeyboardDevice>()>;
    using ElcFactory = std::function<std::unique_ptr<elc::ElcDevice>()>;

    /// Uses KeyboardDevice::create() and ElcDevice::create().
    EffectOrchestrator();
    EffectOrchestrator(KeyboardFactory keyboardFactory, ElcFactory elcFactory);

    /**
     * @brief Apply @p request.
     * @return The one-line summary printed by the CLI, e.g. "Static #FF1493".
     */
    std::string run(const core::EffectRequest& request);

private:
    void dispatch(const core::EffectRequest& request,
                  keyboard::KeyboardDevice* keyboardDevice,
                  elc::ElcDevice* elcDevice,
                  elc::ZoneTargets zones);

    KeyboardFactory keyboardFactory;
    ElcFactory elcFactory;
};

/// Summary line for @p request once defaults have been applied.
std::string describe(const core::EffectRequest& request);

/// @p request with the effect's default colours filled in when it has none.
core::EffectRequest withDefaults(core::EffectRequest request);

} // namespace awlights::effects
