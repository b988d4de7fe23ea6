#include "headless/Runner.hpp"
#include "inv/util/Args.hpp"
#include "inv/util/Log.hpp"
#include <cstdlib>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

void usage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " [--frames N] [--seed S] [--width W] [--height H]"
               " [--realtime] [--quiet] [--log debug|info|warn|error|off]\n";
}

} // namespace

int main(int argc, char **argv) {
  headless::RunnerOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool hasValue = i + 1 < argc;
    if (arg == "--frames") {
      if (!hasValue || !inv::args::parseCount(argv[++i], options.frames)) {
        std::cerr << "Invalid or missing value for " << arg << "\n";
        usage(argv[0]);
        return 1;
      }
    } else if (arg == "--seed") {
      std::uint32_t seed = 0;
      if (!hasValue || !inv::args::parseSeed(argv[++i], seed)) {
        std::cerr << "Invalid or missing value for " << arg << "\n";
        usage(argv[0]);
        return 1;
      }
      options.world.seed = seed;
    } else if (arg == "--width" || arg == "--height") {
      float extent = 0.f;
      if (!hasValue || !inv::args::parseExtent(argv[++i], extent)) {
        std::cerr << "Invalid or missing value for " << arg << "\n";
        usage(argv[0]);
        return 1;
      }
      (arg == "--width" ? options.world.playfield.w : options.world.playfield.h) = extent;
    } else if (arg == "--realtime") {
      options.realtime = true;
    } else if (arg == "--quiet") {
      inv::log::setMinLevel(inv::log::Level::Warn);
    } else if (arg == "--log") {
      inv::log::Level level;
      if (i + 1 >= argc || !inv::log::parseLevel(argv[++i], level)) { usage(argv[0]); return 1; }
      inv::log::setMinLevel(level);
    } else if (arg == "--help" || arg == "-h") {
      usage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      usage(argv[0]);
      return 1;
    }
  }

  headless::Runner runner(options);
  auto frames = runner.run();
  std::cout << "[sim] done: " << frames << " frames, "
            << runner.soundCues() << " explosion cues\n";
  return EXIT_SUCCESS;
}
