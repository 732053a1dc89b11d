#pragma once

#include "awlights/core/ByteBuffer.hpp"
#include "awlights/core/Expected.hpp"
#include "awlights/core/LightingDeviceBase.hpp"
#include "awlights/core/RgbColor.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace awlights::elc {

/// Which of the controller's two zone groups an effect is applied to.
struct ZoneTargets {
    bool ring = true;
    bool logos = true;
};

/**
 * @brief AW-ELC controller: the lid ring and the two logos.
 *
 * The ring is programmed as one user animation. The logos keep their
 * animation per power state, so setLogos() saves the same action for each of
 * the six states before playing everything. Each report costs the transport's
 * fixed post-send delay, which makes logo programming the slowest operation.
 */
class ElcDevice : public core::LightingDeviceBase {
public:
    explicit ElcDevice(std::unique_ptr<hid::ReportSession> session,
                       core::Sleeper sleeper = core::defaultSleeper());
    ~ElcDevice() override;

    /// Locate the controller and build an output-report session for it.
    static std::unique_ptr<ElcDevice> create();

    expected<void> staticColor(const core::RgbColor& color, ZoneTargets targets = {});
    expected<void> breathe(const std::vector<core::RgbColor>& colors, ZoneTargets targets = {});
    expected<void> morph(const std::vector<core::RgbColor>& colors, ZoneTargets targets = {});
    expected<void> spectrum(ZoneTargets targets = {});
    expected<void> pulse(const core::RgbColor& color, ZoneTargets targets = {});
    expected<void> off(ZoneTargets targets = {});

    /// clear, start, select @p zones, action, play. Stops at the first failed send.
    expected<void> setRing(const core::ByteBuffer& action,
                           const std::vector<std::uint8_t>& zones = ringZones());

    /**
     * @brief Commit the pending user animation, then remove/start/select/
     * action/save for every power state and play all.
     *
     * Nothing is read back from the controller, so every state is programmed
     * even when a send fails; the first failure is returned at the end.
     */
    expected<void> setLogos(const core::ByteBuffer& action,
                            const std::vector<std::uint8_t>& zones = logoZones());

    static std::vector<std::uint8_t> ringZones();
    static std::vector<std::uint8_t> logoZones();

private:
    expected<void> apply(const core::ByteBuffer& action, ZoneTargets targets);
};

} // namespace awlights::elc
