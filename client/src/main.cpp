#include "client/ui/App.hpp"
#include "inv/util/Args.hpp"
#include "inv/util/Log.hpp"
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--width W] [--height H] [--seed S] [--log debug|info|warn|error|off]\n";
}

int main(int argc, char** argv) {
    inv::game::WorldConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        bool ok = hasValue;
        if (arg == "--width" && hasValue) {
            ok = inv::args::parseExtent(argv[++i], config.playfield.w);
        } else if (arg == "--height" && hasValue) {
            ok = inv::args::parseExtent(argv[++i], config.playfield.h);
        } else if (arg == "--seed" && hasValue) {
            std::uint32_t seed = 0;
            ok = inv::args::parseSeed(argv[++i], seed);
            if (ok) config.seed = seed;
        } else if (arg == "--log" && hasValue) {
            inv::log::Level level;
            ok = inv::log::parseLevel(argv[++i], level);
            if (ok) inv::log::setMinLevel(level);
        } else {
            ok = false;
        }
        if (!ok) {
            std::cerr << "Invalid or missing value for " << arg << "\n";
            usage(argv[0]);
            return 1;
        }
    }

    client::ui::App app(config);
    app.run();
    return EXIT_SUCCESS;
}
