#include "awlights/hid/DeviceLocator.hpp"

#include "awlights/core/SystemConfig.hpp"
#include "awlights/log/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace awlights::hid {
namespace {

const log::Channel channel{"DeviceLocator"};

constexpr std::string_view HIDRAW_PREFIX = "hidraw";
constexpr std::string_view HID_PHYS_KEY = "HID_PHYS=";

fs::path hidrawClassDir() {
    return fs::path(core::SystemConfig::sysfsPath("class/hidraw"));
}

std::optional<std::string> readFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

// Descriptor paths of every hidraw node, sorted so that the pick is stable.
std::vector<fs::path> enumerateDescriptors() {
    std::vector<fs::path> descriptors;

    std::error_code ec;
    fs::directory_iterator it(hidrawClassDir(), ec);
    if (ec) {
        channel.info("cannot enumerate ", hidrawClassDir().string(),
                     ": ", ec.message(), "\n");
        return descriptors;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto name = it->path().filename().string();
        if (name.compare(0, HIDRAW_PREFIX.size(), HIDRAW_PREFIX) != 0) {
            continue;
        }
        descriptors.push_back(it->path() / "device" / "uevent");
    }

    std::sort(descriptors.begin(), descriptors.end());
    return descriptors;
}

} // namespace

std::optional<std::string> locate(const ControllerIdentity& identity) {
    for (const auto& descriptor : enumerateDescriptors()) {
        auto contents = readFile(descriptor);
        if (!contents) {
            continue;
        }
        if (contents->find(identity.vendorId) == std::string::npos
            || contents->find(identity.productId) == std::string::npos) {
            continue;
        }

        // <sysfs>/class/hidraw/hidrawN/device/uevent -> hidrawN
        const auto node = descriptor.parent_path().parent_path().filename().string();
        return core::SystemConfig::devPath(node);
    }
    return std::nullopt;
}

std::optional<std::string> readPhysicalBusId(const std::string& devicePath) {
    const auto node = fs::path(devicePath).filename();
    auto contents = readFile(hidrawClassDir() / node / "device" / "uevent");
    if (!contents) {
        return std::nullopt;
    }

    std::istringstream lines(*contents);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, HID_PHYS_KEY.size(), HID_PHYS_KEY) != 0) {
            continue;
        }
        std::string phys = line.substr(HID_PHYS_KEY.size());
        phys = phys.substr(0, phys.find('/'));
        while (!phys.empty() && (phys.back() == '\r' || phys.back() == ' ')) {
            phys.pop_back();
        }
        if (phys.empty()) {
            return std::nullopt;
        }
        return phys;
    }
    return std::nullopt;
}

} // namespace awlights::hid
