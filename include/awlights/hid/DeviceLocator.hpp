#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace awlights::hid {

/**
 * @brief Vendor/product pair of one controller class, as it appears in the
 * HID_ID line of a hidraw uevent (upper-case hex, e.g. "0D62").
 */
struct ControllerIdentity {
    std::string_view vendorId;
    std::string_view productId;
    std::string_view name;
};

/**
 * @brief Resolve a controller to its /dev/hidrawN node.
 *
 * Scans <sysfs>/class/hidraw/hidraw<N>/device/uevent in lexicographic path
 * order and returns the node of the first descriptor whose text contains both
 * identifiers. std::nullopt means the controller is not present.
 */
std::optional<std::string> locate(const ControllerIdentity& identity);

/**
 * @brief Physical bus id of a hidraw node, used to rebind usbhid.
 *
 * Reads the HID_PHYS field of the node's uevent and keeps the part before the
 * first '/'. std::nullopt when the descriptor or the field is missing.
 */
std::optional<std::string> readPhysicalBusId(const std::string& devicePath);

} // namespace awlights::hid
