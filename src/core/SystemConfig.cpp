#include "awlights/core/SystemConfig.hpp"

#include <cstdlib>
#include <cstring>

namespace awlights::core {

void SystemConfig::loadFromEnvironment() {
    Settings settings = current();

    if (const char* root = std::getenv("AWLIGHTS_SYSFS_ROOT"); root && *root) {
        settings.sysfsRoot = root;
    }
    if (const char* root = std::getenv("AWLIGHTS_DEV_ROOT"); root && *root) {
        settings.devRoot = root;
    }
    if (const char* dump = std::getenv("AWLIGHTS_DUMP_PACKETS"); dump) {
        settings.dumpPackets = *dump && std::strcmp(dump, "0") != 0;
    }

    set(std::move(settings));
}

} // namespace awlights::core
