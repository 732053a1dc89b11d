#pragma once

#include "awlights/core/ByteBuffer.hpp"
#include "awlights/core/Expected.hpp"
#include "awlights/core/Sleeper.hpp"
#include "awlights/hid/ReportSession.hpp"

#include <chrono>
#include <memory>

namespace awlights::core {

/**
 * @brief Base class for one lighting controller.
 *
 * Owns the controller's ReportSession and the Sleeper that spaces commands.
 * Subclasses (KeyboardDevice, ElcDevice) encode effects into payloads and
 * push them through send(). This base class only handles:
 * - Opening and closing the session.
 * - Forwarding payloads and pauses to the session and sleeper.
 *
 * Threading model: none. A device is driven by one caller and every protocol
 * step blocks until its mandated delay has elapsed.
 */
class LightingDeviceBase {
public:
    LightingDeviceBase(std::unique_ptr<hid::ReportSession> session, Sleeper sleeper);
    virtual ~LightingDeviceBase();

    LightingDeviceBase(const LightingDeviceBase&) = delete;
    LightingDeviceBase& operator=(const LightingDeviceBase&) = delete;

    /**
     * @brief Open the underlying session.
     * @return false when the controller is absent or cannot be opened. The
     * session has already logged a warning in that case.
     */
    bool open();

    virtual void close();

    bool isOpen() const;

protected:
    expected<void> send(const ByteBuffer& payload);
    void pause(std::chrono::milliseconds duration);

    std::unique_ptr<hid::ReportSession> session;
    Sleeper sleeper;
};

} // namespace awlights::core
