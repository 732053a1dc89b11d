#pragma once

#include "awlights/core/Expected.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <hidapi/hidapi.h>

namespace awlights::hid {

/**
 * @brief Raw report I/O on one opened HID device.
 *
 * Reports are passed fully framed, report id first. Sessions own exactly one
 * transport and decide which of the two send paths their controller uses.
 */
class HidTransport {
public:
    virtual ~HidTransport() = default;

    virtual bool open(const std::string& path) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual expected<void> sendFeatureReport(const std::vector<std::uint8_t>& report) = 0;
    virtual expected<void> writeReport(const std::vector<std::uint8_t>& report) = 0;

    /// Description of the most recent failure, for log lines.
    virtual std::string lastError() const = 0;
};

/// HidTransport backed by hidapi (hidraw backend on Linux).
class HidapiTransport : public HidTransport {
public:
    HidapiTransport() = default;
    ~HidapiTransport() override;

    HidapiTransport(const HidapiTransport&) = delete;
    HidapiTransport& operator=(const HidapiTransport&) = delete;

    bool open(const std::string& path) override;
    void close() override;
    bool isOpen() const override;

    expected<void> sendFeatureReport(const std::vector<std::uint8_t>& report) override;
    expected<void> writeReport(const std::vector<std::uint8_t>& report) override;

    std::string lastError() const override;

private:
    struct HidDeleter {
        void operator()(hid_device* device) const noexcept;
    };

    static bool ensureInitialized();

    std::unique_ptr<hid_device, HidDeleter> handle;
};

} // namespace awlights::hid
