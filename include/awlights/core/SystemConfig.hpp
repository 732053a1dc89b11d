#pragma once

#include <string>
#include <utility>

namespace awlights::core {

/**
 * @brief Process-wide locations of the kernel interfaces the devices use.
 *
 * Production code never changes these; tests relocate sysfs and devfs into a
 * temporary directory through ScopedOverride.
 */
class SystemConfig {
public:
    struct Settings {
        std::string sysfsRoot = "/sys";
        std::string devRoot = "/dev";
        std::string privilegeHelper = "pkexec";
        bool dumpPackets = false;
    };

    static const Settings& current() {
        return storage();
    }

    static void set(Settings settings) {
        storage() = std::move(settings);
    }

    /**
     * @brief Apply AWLIGHTS_SYSFS_ROOT, AWLIGHTS_DEV_ROOT and
     * AWLIGHTS_DUMP_PACKETS from the environment on top of the current values.
     */
    static void loadFromEnvironment();

    static std::string sysfsPath(const std::string& relative) {
        return storage().sysfsRoot + "/" + relative;
    }

    static std::string devPath(const std::string& relative) {
        return storage().devRoot + "/" + relative;
    }

    /** RAII helper that temporarily replaces the settings. */
    class ScopedOverride {
    public:
        explicit ScopedOverride(Settings settings)
        : previous_(storage()) {
            storage() = std::move(settings);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            storage() = previous_;
        }

    private:
        Settings previous_;
    };

private:
    static Settings& storage() {
        static Settings settings;
        return settings;
    }
};

} // namespace awlights::core
