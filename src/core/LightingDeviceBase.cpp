#include "awlights/core/LightingDeviceBase.hpp"

#include <utility>

namespace awlights::core {

LightingDeviceBase::LightingDeviceBase(std::unique_ptr<hid::ReportSession> sessionValue,
                                       Sleeper sleeperValue)
: session(std::move(sessionValue))
, sleeper(sleeperValue ? std::move(sleeperValue) : defaultSleeper()) {
}

LightingDeviceBase::~LightingDeviceBase() = default;

bool LightingDeviceBase::open() {
    return session && session->open();
}

void LightingDeviceBase::close() {
    if (session) {
        session->close();
    }
}

bool LightingDeviceBase::isOpen() const {
    return session && session->isOpen();
}

expected<void> LightingDeviceBase::send(const ByteBuffer& payload) {
    if (!session) {
        return fail(std::errc::not_connected);
    }
    return session->send(payload);
}

void LightingDeviceBase::pause(std::chrono::milliseconds duration) {
    sleeper(duration);
}

} // namespace awlights::core
