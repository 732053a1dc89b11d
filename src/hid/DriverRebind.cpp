#include "awlights/hid/DriverRebind.hpp"

#include "awlights/core/SystemConfig.hpp"
#include "awlights/log/Log.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <utility>
#include <vector>

extern char** environ;

namespace awlights::hid {
namespace {

const log::Channel channel{"DriverRebind"};

constexpr const char* USBHID_DRIVER_DIR = "bus/usb/drivers/usbhid";

std::string controlFile(const char* name) {
    return core::SystemConfig::sysfsPath(std::string(USBHID_DRIVER_DIR) + "/" + name);
}

bool isPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied
        || ec == std::errc::operation_not_permitted;
}

// Arguments are passed positionally so the bus id never reaches the shell parser.
constexpr const char* REBIND_SCRIPT =
    "echo \"$1\" > \"$2\"; sleep 0.2; echo \"$1\" > \"$3\"";

} // namespace

expected<void> writeControlFile(const std::string& path, const std::string& value) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return unexpected(lastSystemError());
    }

    const ssize_t written = ::write(fd, value.data(), value.size());
    const std::error_code writeError = written < 0 ? lastSystemError() : std::error_code{};
    ::close(fd);

    if (writeError) {
        return unexpected(writeError);
    }
    if (static_cast<std::size_t>(written) != value.size()) {
        return fail(std::errc::io_error);
    }
    return {};
}

expected<void> rebindGenericDriver(const std::string& physicalBusId,
                                   const core::Sleeper& sleeper,
                                   const ControlFileWriter& writer) {
    auto unbound = writer(controlFile("unbind"), physicalBusId);
    if (unbound) {
        sleeper(REBIND_SETTLE_DELAY);
        auto bound = writer(controlFile("bind"), physicalBusId);
        if (bound) {
            channel.info("rebound usbhid on ", physicalBusId, "\n");
            return {};
        }
        unbound = std::move(bound);
    }

    if (!isPermissionError(unbound.error())) {
        return unbound;
    }

    channel.info("direct rebind denied, escalating through ",
                 core::SystemConfig::current().privilegeHelper, "\n");
    return runPrivilegedRebind(physicalBusId);
}

expected<void> runPrivilegedRebind(const std::string& physicalBusId) {
    const std::string helper = core::SystemConfig::current().privilegeHelper;
    const std::string unbindPath = controlFile("unbind");
    const std::string bindPath = controlFile("bind");

    std::vector<std::string> args = {
        helper, "sh", "-c", REBIND_SCRIPT, "sh", physicalBusId, unbindPath, bindPath
    };
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    // The helper's own output is not interesting to the user.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = 0;
    const int spawnResult = posix_spawnp(&pid, helper.c_str(), &actions, nullptr,
                                         argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (spawnResult != 0) {
        return unexpected(std::error_code(spawnResult, std::system_category()));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return unexpected(lastSystemError());
        }
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return fail(std::errc::operation_not_permitted);
    }
    return {};
}

} // namespace awlights::hid
