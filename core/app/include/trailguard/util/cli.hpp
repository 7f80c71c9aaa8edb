#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace trailguard {
namespace util {

// Command-line arguments of the trailguard binary. Anything set here
// overrides the config file.
struct CLIArgs {
  std::string config_path;
  std::string orders_file;
  std::vector<std::string> tickers;
  std::optional<std::int64_t> poll_interval_ms;
  bool verbose = false;
  bool simulate = false;
  bool help = false;
};

inline void print_help() {
  std::cout << R"(
trailguard - ATR trailing-stop position monitor
===============================================

Usage: trailguard [options]

Options:
  -c, --config PATH         JSON config file (defaults apply without one)
  -o, --orders-file PATH    Also track entries from an orders file
  -t, --tickers SYMS        Only track these tickers (comma-separated)
  -i, --poll-interval SECS  Price poll interval in seconds (default: 5)
  -s, --simulate            Run against an in-process mock broker
  -v, --verbose             Log every price check and skipped tick
  -h, --help                Show this help

Examples:
  trailguard -c config/trailguard.example.json
  trailguard --orders-file orders.json --tickers INFY,TCS -i 10
  trailguard --simulate --tickers INFY,TCS -v

Exit codes:
  0  clean shutdown (market close, SHUTDOWN command, Ctrl-C)
  1  startup failure (bad config, authentication, nothing to monitor)
  2  threads did not stop in time and the process was terminated

WARNING: Without --simulate, exit orders are sent to the live broker!
)";
}

// Splits "infy, tcs" into {"INFY", "TCS"}.
inline std::vector<std::string> split_symbols(const std::string& s) {
  std::vector<std::string> result;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    std::transform(item.begin(), item.end(), item.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    if (!item.empty()) {
      result.push_back(item);
    }
  }
  return result;
}

// Returns false (after printing the reason) on an unknown option, a missing
// value or a malformed number.
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
    } else if (arg == "--verbose" || arg == "-v") {
      args.verbose = true;
    } else if (arg == "--simulate" || arg == "-s") {
      args.simulate = true;
    } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if ((arg == "--orders-file" || arg == "-o") && i + 1 < argc) {
      args.orders_file = argv[++i];
    } else if ((arg == "--tickers" || arg == "-t") && i + 1 < argc) {
      args.tickers = split_symbols(argv[++i]);
    } else if ((arg == "--poll-interval" || arg == "-i") && i + 1 < argc) {
      const std::string value = argv[++i];
      double seconds = 0.0;
      try {
        seconds = std::stod(value);
      } catch (const std::logic_error&) {
        std::cerr << "Invalid poll interval: " << value << "\n";
        return false;
      }
      if (!(seconds > 0.0)) {
        std::cerr << "Poll interval must be positive: " << value << "\n";
        return false;
      }
      args.poll_interval_ms = static_cast<std::int64_t>(seconds * 1000.0);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      std::cerr << "Use --help for usage information.\n";
      return false;
    }
  }
  return true;
}

}  // namespace util
}  // namespace trailguard
