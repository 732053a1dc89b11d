#pragma once

#include "awlights/core/ByteBuffer.hpp"
#include "awlights/core/Expected.hpp"
#include "awlights/core/Sleeper.hpp"
#include "awlights/hid/HidTransport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace awlights::hid {

enum class ReportType : std::uint8_t {
    Feature,
    Output
};

/**
 * @brief Framing of one controller's reports: a report id byte, the payload,
 * then zero padding up to a fixed total size.
 */
struct ReportFormat {
    ReportType type = ReportType::Output;
    std::uint8_t reportId = 0;
    std::size_t reportSize = 0; // id byte included

    constexpr std::size_t maxPayload() const { return reportSize - 1; }
};

/**
 * @brief Build the fixed-size frame for @p payload.
 * @return std::errc::message_size when the payload does not fit.
 */
expected<std::vector<std::uint8_t>> frameReport(const ReportFormat& format,
                                                const core::ByteBuffer& payload);

/**
 * @brief One exclusive session with a controller.
 *
 * Implementations are used from a single thread by the one device that owns
 * them. send() on a closed session returns std::errc::not_connected.
 */
class ReportSession {
public:
    virtual ~ReportSession() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual expected<void> send(const core::ByteBuffer& payload) = 0;
};

/**
 * @brief ReportSession over the hidraw node found by the locator.
 *
 * Frames payloads, dumps them when packet dumping is on, and leaves the
 * actual transfer to the subclass. Without an explicit transport the session
 * talks through hidapi.
 */
class HidReportSession : public ReportSession {
public:
    HidReportSession(std::string name, ReportFormat format,
                     std::optional<std::string> devicePath,
                     std::unique_ptr<HidTransport> transport = nullptr);
    ~HidReportSession() override;

    HidReportSession(const HidReportSession&) = delete;
    HidReportSession& operator=(const HidReportSession&) = delete;

    bool open() override;
    void close() override;   // idempotent
    bool isOpen() const override;
    expected<void> send(const core::ByteBuffer& payload) override;

    const std::optional<std::string>& devicePath() const { return path; }
    const ReportFormat& format() const { return reportFormat; }

protected:
    virtual expected<void> transmit(const std::vector<std::uint8_t>& frame) = 0;

    HidTransport& transport() { return *device; }

private:
    std::string name;
    ReportFormat reportFormat;
    std::optional<std::string> path;
    std::unique_ptr<HidTransport> device;
};

/// Keyboard transport: feature reports, no delay of its own.
class FeatureReportSession : public HidReportSession {
public:
    FeatureReportSession(std::string name, ReportFormat format,
                         std::optional<std::string> devicePath,
                         std::unique_ptr<HidTransport> transport = nullptr);

protected:
    expected<void> transmit(const std::vector<std::uint8_t>& frame) override;
};

/**
 * @brief ELC transport: output reports, each followed by a fixed pause. The
 * firmware handles commands serially without flow control, so every report
 * that reached the device is spaced by at least @p postSendDelay, including
 * one whose write failed.
 */
class OutputReportSession : public HidReportSession {
public:
    OutputReportSession(std::string name, ReportFormat format,
                        std::optional<std::string> devicePath,
                        std::chrono::milliseconds postSendDelay,
                        core::Sleeper sleeper = core::defaultSleeper(),
                        std::unique_ptr<HidTransport> transport = nullptr);

protected:
    expected<void> transmit(const std::vector<std::uint8_t>& frame) override;

private:
    std::chrono::milliseconds postSendDelay;
    core::Sleeper sleeper;
};

} // namespace awlights::hid
