#pragma once

/**
 * CLI utilities for the tickguard engine
 *
 * Provides command-line argument parsing and related utilities.
 */

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tickguard {
namespace util {

/**
 * Command-line arguments for the tickguard executable.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    bool summary = false;        // print circuit breaker summary and exit
    std::string config_path;     // empty = built-in defaults
    std::string store_path;      // overrides store.path from the config
    std::string import_path;     // JSON array of trades to add at startup
    std::vector<std::string> reset_keys; // SYMBOL|DIRECTION|SOURCE
    int duration = 0;            // 0 = unlimited
};

/**
 * Print help message for the tickguard executable.
 */
inline void print_help() {
    std::cout << R"(
tickguard - real-time trade exit engine
=======================================

Usage: tickguard [options]

Options:
  -c, --config FILE      Engine configuration (JSON)
  -s, --store FILE       State file (overrides store.path)
  -i, --import FILE      Add trades from a JSON array at startup
  -d, --duration SECS    Run for SECS seconds (0 = until SIGINT/SIGTERM)
  --summary              Print the circuit breaker summary and exit
  --reset KEY            Return a paused or blacklisted asset to active
                         (KEY = SYMBOL|DIRECTION|SOURCE, repeatable)
  -v, --verbose          Debug logging
  -h, --help             Show this help

Examples:
  tickguard -c config/tickguard.example.json
  tickguard -s state.json -i new_trades.json -d 600
  tickguard -s state.json --summary
  tickguard -s state.json --reset "BTCUSDT|LONG|alpha"
)";
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--summary") {
            args.summary = true;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if ((arg == "--store" || arg == "-s") && i + 1 < argc) {
            args.store_path = argv[++i];
        }
        else if ((arg == "--import" || arg == "-i") && i + 1 < argc) {
            args.import_path = argv[++i];
        }
        else if (arg == "--reset" && i + 1 < argc) {
            args.reset_keys.push_back(argv[++i]);
        }
        else if ((arg == "--duration" || arg == "-d") && i + 1 < argc) {
            try {
                args.duration = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid duration: " << argv[i] << "\n";
                return false;
            }
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

/**
 * Split "SYMBOL|DIRECTION|SOURCE" into its three fields.
 *
 * @return false unless there are exactly three non-empty fields
 */
inline bool split_asset_key(const std::string& s, std::string& symbol, std::string& direction, std::string& source) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, '|')) {
        parts.push_back(item);
    }
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty())
        return false;
    symbol = parts[0];
    direction = parts[1];
    source = parts[2];
    return true;
}

}  // namespace util
}  // namespace tickguard
