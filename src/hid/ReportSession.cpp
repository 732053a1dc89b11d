#include "awlights/hid/ReportSession.hpp"

#include "awlights/core/SystemConfig.hpp"
#include "awlights/log/Log.hpp"

#include <algorithm>
#include <utility>

namespace awlights::hid {

expected<std::vector<std::uint8_t>> frameReport(const ReportFormat& format,
                                                const core::ByteBuffer& payload) {
    if (format.reportSize == 0 || payload.size() > format.maxPayload()) {
        return fail(std::errc::message_size);
    }

    std::vector<std::uint8_t> frame(format.reportSize, 0);
    frame[0] = format.reportId;
    std::copy(payload.data(), payload.data() + payload.size(), frame.begin() + 1);
    return frame;
}

HidReportSession::HidReportSession(std::string nameValue, ReportFormat format,
                                   std::optional<std::string> devicePath,
                                   std::unique_ptr<HidTransport> transportValue)
: name(std::move(nameValue))
, reportFormat(format)
, path(std::move(devicePath))
, device(transportValue ? std::move(transportValue)
                        : std::make_unique<HidapiTransport>()) {
}

HidReportSession::~HidReportSession() {
    close();
}

bool HidReportSession::open() {
    if (isOpen()) {
        return true;
    }
    if (!path) {
        logWarning(name, " not found\n");
        return false;
    }

    if (!device->open(*path)) {
        logWarning("cannot open ", name, " at ", *path, ": ", device->lastError(), "\n");
        return false;
    }

    log::Channel(name).info("opened ", *path, "\n");
    return true;
}

void HidReportSession::close() {
    if (device->isOpen()) {
        device->close();
    }
}

bool HidReportSession::isOpen() const {
    return device->isOpen();
}

expected<void> HidReportSession::send(const core::ByteBuffer& payload) {
    const log::Channel channel(name);

    if (!isOpen()) {
        return fail(std::errc::not_connected);
    }

    auto frame = frameReport(reportFormat, payload);
    if (!frame) {
        channel.error("payload of ", payload.size(), " bytes exceeds ",
                      reportFormat.maxPayload(), "\n");
        return unexpected(frame.error());
    }

    if (core::SystemConfig::current().dumpPackets) {
        channel.info("TX ", frame->size(), " bytes: ",
                     core::toHexLine(frame->data(), frame->size()), "\n");
    }

    auto result = transmit(*frame);
    if (!result) {
        channel.error("command 0x", core::toHexLine(frame->data() + 1, 1), " failed: ",
                      device->lastError(), "\n");
    }
    return result;
}

FeatureReportSession::FeatureReportSession(std::string name, ReportFormat format,
                                           std::optional<std::string> devicePath,
                                           std::unique_ptr<HidTransport> transport)
: HidReportSession(std::move(name), format, std::move(devicePath), std::move(transport)) {
}

expected<void> FeatureReportSession::transmit(const std::vector<std::uint8_t>& frame) {
    return transport().sendFeatureReport(frame);
}

OutputReportSession::OutputReportSession(std::string name, ReportFormat format,
                                         std::optional<std::string> devicePath,
                                         std::chrono::milliseconds delay,
                                         core::Sleeper sleeperValue,
                                         std::unique_ptr<HidTransport> transport)
: HidReportSession(std::move(name), format, std::move(devicePath), std::move(transport))
, postSendDelay(delay)
, sleeper(sleeperValue ? std::move(sleeperValue) : core::defaultSleeper()) {
}

expected<void> OutputReportSession::transmit(const std::vector<std::uint8_t>& frame) {
    auto result = transport().writeReport(frame);
    sleeper(postSendDelay);
    return result;
}

} // namespace awlights::hid
