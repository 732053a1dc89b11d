#include "awlights/core/EffectRequest.hpp"
#include "awlights/core/RgbColor.hpp"
#include "awlights/core/SystemConfig.hpp"
#include "awlights/effects/EffectOrchestrator.hpp"
#include "awlights/log/Log.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace awlights;

namespace {

constexpr const char* USAGE = R"(Alienware x15 R1 RGB light controller.

Usage:
  awlights static RRGGBB           Set all lights to a solid color
  awlights breathe RRGGBB [RRGGBB] Breathing effect with 1-3 colors
  awlights morph RRGGBB RRGGBB ... Morph/cycle between 2-3 colors
  awlights spectrum                Rainbow spectrum cycle
  awlights wave                    Rainbow wave effect
  awlights pulse RRGGBB            Pulsing single color
  awlights off                     Turn all lights off

  Targets (optional, default: all):
    --keyboard   Only keyboard
    --tron       Only tron (ring + logos)
    --ring       Only ring
    --logos      Only logos

Examples:
  awlights static FF1493
  awlights breathe FF0000 00FF00 0000FF
  awlights spectrum --keyboard
  awlights off

Environment:
  AWLIGHTS_DUMP_PACKETS=1   Print every report before it is sent
)";

void printUsage() {
    logInfo(USAGE);
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);

    if (args.empty() || args.front() == "-h" || args.front() == "--help") {
        printUsage();
        return 0;
    }

    core::SystemConfig::loadFromEnvironment();

    bool keyboard = false;
    bool tron = false;
    bool ring = false;
    bool logos = false;
    std::vector<std::string_view> positional;

    for (const auto arg : args) {
        if (arg == "--keyboard") {
            keyboard = true;
        } else if (arg == "--tron") {
            tron = true;
        } else if (arg == "--ring") {
            ring = true;
        } else if (arg == "--logos") {
            logos = true;
        } else if (arg.substr(0, 2) == "--") {
            logWarning("ignoring unknown option ", arg, "\n");
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        logError("Missing command\n");
        printUsage();
        return 1;
    }

    const auto kind = core::parseEffectKind(positional.front());
    if (!kind) {
        logError("Unknown command: ", positional.front(), "\n");
        printUsage();
        return 1;
    }

    core::EffectRequest request;
    request.kind = *kind;
    request.targets = core::TargetSelection::fromFlags(keyboard, tron, ring, logos);

    for (std::size_t i = 1; i < positional.size(); ++i) {
        auto color = core::parseColor(positional[i]);
        if (!color) {
            logError("Invalid color: ", positional[i], " (expected RRGGBB)\n");
            return 1;
        }
        request.colors.push_back(*color);
    }

    effects::EffectOrchestrator orchestrator;
    logInfo(orchestrator.run(request), "\n");
    return 0;
}
