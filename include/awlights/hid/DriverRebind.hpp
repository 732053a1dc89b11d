#pragma once

#include "awlights/core/Expected.hpp"
#include "awlights/core/Sleeper.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace awlights::hid {

/// Pause between the unbind and bind writes.
constexpr std::chrono::milliseconds REBIND_SETTLE_DELAY{200};

/// Writes one value to a sysfs control file.
using ControlFileWriter = std::function<expected<void>(const std::string& path,
                                                       const std::string& value)>;

/// open(O_WRONLY) + write(); errno is returned as a system_category code.
expected<void> writeControlFile(const std::string& path, const std::string& value);

/**
 * @brief Detach and reattach usbhid from one physical device.
 *
 * Writes @p physicalBusId to <sysfs>/bus/usb/drivers/usbhid/unbind, waits
 * REBIND_SETTLE_DELAY, then writes it to .../bind. Direct access denied
 * (EACCES / EPERM) falls back to runPrivilegedRebind(). Rebinding an already
 * bound device is harmless, so the operation can be repeated.
 *
 * @param writer Performs the two writes; defaults to writeControlFile().
 */
expected<void> rebindGenericDriver(const std::string& physicalBusId,
                                   const core::Sleeper& sleeper = core::defaultSleeper(),
                                   const ControlFileWriter& writer = writeControlFile);

/**
 * @brief Same two writes and pause, performed by a shell running under the
 * configured privilege helper (pkexec by default). Waits for the helper to
 * exit; a non-zero status is reported as std::errc::operation_not_permitted.
 */
expected<void> runPrivilegedRebind(const std::string& physicalBusId);

} // namespace awlights::hid
