#include "awlights/hid/HidTransport.hpp"

#include <cwchar>

namespace awlights::hid {
namespace {

// hidapi reports errors as wide strings; device messages are plain ASCII.
std::string narrow(const wchar_t* message) {
    if (!message) {
        return "unknown hidapi error";
    }
    std::string out;
    out.reserve(std::wcslen(message));
    for (const wchar_t* c = message; *c; ++c) {
        out.push_back(*c < 0x80 ? static_cast<char>(*c) : '?');
    }
    return out;
}

expected<void> checkTransfer(int result, std::size_t expectedSize) {
    if (result < 0 || static_cast<std::size_t>(result) != expectedSize) {
        return fail(std::errc::io_error);
    }
    return {};
}

} // namespace

void HidapiTransport::HidDeleter::operator()(hid_device* device) const noexcept {
    if (device) {
        hid_close(device);
    }
}

HidapiTransport::~HidapiTransport() = default;

bool HidapiTransport::ensureInitialized() {
    static const bool initialized = (hid_init() == 0);
    return initialized;
}

bool HidapiTransport::open(const std::string& path) {
    if (handle) {
        return true;
    }
    if (!ensureInitialized()) {
        return false;
    }

    handle.reset(hid_open_path(path.c_str()));
    if (!handle) {
        return false;
    }
    hid_set_nonblocking(handle.get(), 1);
    return true;
}

void HidapiTransport::close() {
    handle.reset();
}

bool HidapiTransport::isOpen() const {
    return static_cast<bool>(handle);
}

expected<void> HidapiTransport::sendFeatureReport(const std::vector<std::uint8_t>& report) {
    if (!handle) {
        return fail(std::errc::not_connected);
    }
    return checkTransfer(hid_send_feature_report(handle.get(), report.data(), report.size()),
                         report.size());
}

expected<void> HidapiTransport::writeReport(const std::vector<std::uint8_t>& report) {
    if (!handle) {
        return fail(std::errc::not_connected);
    }
    return checkTransfer(hid_write(handle.get(), report.data(), report.size()), report.size());
}

std::string HidapiTransport::lastError() const {
    // hid_error(nullptr) carries the failure of the last hid_open_path().
    return narrow(hid_error(handle.get()));
}

} // namespace awlights::hid
