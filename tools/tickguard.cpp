/**
 * tickguard - real-time trade exit engine
 *
 * Tracks every active trade in the state file against live ticks, closes
 * trades on TP3, stop-loss or timeout, and maintains per-asset circuit
 * breakers.
 *
 * Usage:
 *   tickguard -c config.json               # Run until SIGINT/SIGTERM
 *   tickguard -s state.json -i trades.json # Import trades, then run
 *   tickguard -s state.json --summary      # Circuit breaker report
 *   tickguard -h                           # Help
 */

#include "../include/tickguard/config/engine_config.hpp"
#include "../include/tickguard/exits/exit_evaluator.hpp"
#include "../include/tickguard/logging/async_logger.hpp"
#include "../include/tickguard/market/connection_multiplexer.hpp"
#include "../include/tickguard/risk/circuit_breaker.hpp"
#include "../include/tickguard/storage/json_codec.hpp"
#include "../include/tickguard/storage/json_file_store.hpp"
#include "../include/tickguard/tracking/milestone_recorder.hpp"
#include "../include/tickguard/tracking/post_trade_pipeline.hpp"
#include "../include/tickguard/tracking/trade_tracker.hpp"
#include "../include/tickguard/util/cli.hpp"
#include "../include/tickguard/util/system.hpp"
#include "../include/tickguard/util/time_utils.hpp"
#include "../include/tickguard/venue/ws_venue.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

using namespace tickguard;
using tickguard::util::CLIArgs;

// ============================================================================
// Global State
// ============================================================================

std::atomic<bool> g_running{true};

constexpr int STATUS_INTERVAL_SEC = 60;

// ============================================================================
// Helpers
// ============================================================================

static void print_summary(const risk::BreakerSummary& summary) {
    std::cout << "\nCircuit Breaker Summary\n";
    std::cout << "=======================\n";
    std::cout << "  active: " << summary.active << "  recovery: " << summary.recovery << "  paused: " << summary.paused
              << "  blacklisted: " << summary.blacklisted << "\n\n";

    for (const auto& asset : summary.assets) {
        const auto& r = asset.record;
        std::cout << "  " << std::left << std::setw(36) << r.key.to_string() << std::setw(12)
                  << risk::asset_status_to_string(r.status) << std::setw(12) << risk::risk_profile_to_string(r.profile)
                  << "health " << std::fixed << std::setprecision(0) << asset.health_score << "  WR "
                  << std::setprecision(1) << r.metrics.win_rate << "%  P&L(20) " << std::setprecision(2)
                  << r.metrics.cumulative_pnl_20 << "%";
        if (!r.reason.empty())
            std::cout << "  (" << r.reason << ")";
        std::cout << "\n";
    }

    if (!summary.recent_alerts.empty()) {
        std::cout << "\nRecent alerts:\n";
        for (const auto& alert : summary.recent_alerts) {
            std::cout << "  [" << risk::alert_severity_to_string(alert.severity) << "] "
                      << util::format_timestamp(alert.at) << " " << alert.key.to_string() << ": " << alert.reason
                      << "\n";
        }
    }
    std::cout << "\n";
}

static std::vector<trading::Trade> read_trades(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open trade file: " + path);
    }
    json doc = json::parse(file);
    if (!doc.is_array()) {
        throw std::runtime_error("Trade file must contain a JSON array: " + path);
    }
    return doc.get<std::vector<trading::Trade>>();
}

static std::vector<std::unique_ptr<venue::IVenue>> make_venues(const config::VenueSettings& settings) {
    std::vector<std::string> names = settings.priority;
    if (std::find(names.begin(), names.end(), settings.polling_venue) == names.end())
        names.push_back(settings.polling_venue);

    std::vector<std::unique_ptr<venue::IVenue>> venues;
    for (const auto& name : names) {
        venues.push_back(std::make_unique<venue::WsVenue>(venue::make_protocol(name, settings.use_testnet)));
    }
    return venues;
}

// ============================================================================
// Run
// ============================================================================

static int run(const CLIArgs& args) {
    config::EngineConfig cfg;
    if (!args.config_path.empty()) {
        cfg = config::ConfigParser::load(args.config_path);
    }
    if (!args.store_path.empty()) {
        cfg.store.path = args.store_path;
    }

    logging::AsyncLogger logger;
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::string_to_level(cfg.logging.level));
    logger.start();

    storage::JsonFileStore store(cfg.store.path);
    if (store.load()) {
        TICKGUARD_LOGF(logger, Info, Store, "Loaded state from %s", store.path().c_str());
    } else {
        TICKGUARD_LOGF(logger, Info, Store, "No state at %s, starting empty", store.path().c_str());
    }

    risk::CircuitBreaker breaker(store, cfg.circuit_breaker, logger);
    breaker.set_alert_callback([](const risk::Alert& alert) {
        std::cout << "[ALERT " << risk::alert_severity_to_string(alert.severity) << "] " << alert.key.to_string()
                  << " -> " << risk::asset_status_to_string(alert.status) << ": " << alert.reason << "\n";
    });

    for (const auto& key_text : args.reset_keys) {
        std::string symbol, direction, source;
        if (!util::split_asset_key(key_text, symbol, direction, source)) {
            std::cerr << "Invalid asset key: " << key_text << " (expected SYMBOL|DIRECTION|SOURCE)\n";
            return 1;
        }
        risk::AssetKey key{symbol, string_to_direction(direction), source};
        breaker.reset(key, util::wall_clock_ns());
        std::cout << "[RESET] " << key.to_string() << " -> active\n";
    }

    if (args.summary) {
        logger.stop();
        print_summary(breaker.summary(util::wall_clock_ns()));
        return 0;
    }

    std::cout << "\ntickguard - " << cfg.venues.priority.size() << " streaming venues, polling via "
              << cfg.venues.polling_venue << (cfg.venues.use_testnet ? " (testnet)" : "") << "\n";
    std::cout << "================================================================\n\n";

    market::ConnectionMultiplexer mux(make_venues(cfg.venues), cfg.venues, cfg.multiplexer, logger);
    exits::ExitEvaluatorTable exits(cfg.exits);
    tracking::MilestoneRecorder milestones(store, logger);
    tracking::DefaultPostTradePipeline pipeline(breaker, store, logger);
    tracking::TradeTracker tracker(mux, store, milestones, exits, pipeline, cfg.tracker, logger);
    tracker.set_admission_check([&breaker](const trading::Trade& t) {
        return breaker.is_trading_allowed(risk::AssetKey{t.symbol, t.direction, t.signal_source},
                                          util::wall_clock_ns());
    });

    mux.start();
    size_t loaded = tracker.start_tracking();
    std::cout << "Tracking " << loaded << " active trades from " << store.path() << "\n";

    if (!args.import_path.empty()) {
        size_t added = 0;
        for (auto& trade : read_trades(args.import_path)) {
            std::string identifier = trade.identifier;
            try {
                if (tracker.add_trade(std::move(trade)))
                    ++added;
            } catch (const storage::StoreError& e) {
                TICKGUARD_LOGF(logger, Warn, Tracker, "Skipping imported trade %s: %s", identifier.c_str(), e.what());
            }
        }
        std::cout << "Imported " << added << " trades from " << args.import_path;
        if (auto rejected = tracker.stats().trades_rejected)
            std::cout << " (" << rejected << " refused by the circuit breaker)";
        std::cout << "\n";
    }

    auto start = std::chrono::steady_clock::now();
    auto last_status = start;

    while (g_running) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start).count();

        if (args.duration > 0 && elapsed >= args.duration)
            break;

        if (std::chrono::duration_cast<std::chrono::seconds>(now - last_status).count() >= STATUS_INTERVAL_SEC) {
            last_status = now;
            auto ts = tracker.stats();
            auto cs = mux.connection_stats();
            TICKGUARD_LOGF(logger, Info, System,
                           "Status: %zu trades on %zu instruments | streams %zu polling %zu | ticks %llu dropped %llu "
                           "| commits %llu failed %llu",
                           ts.active_trades, ts.tracked_instruments, cs.active_streams, cs.polling_instruments,
                           static_cast<unsigned long long>(ts.ticks_processed),
                           static_cast<unsigned long long>(ts.ticks_dropped), static_cast<unsigned long long>(ts.commits),
                           static_cast<unsigned long long>(ts.commit_failures));
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (int sig = util::shutdown_signal()) {
        std::cout << "\n\n[SHUTDOWN] Received signal " << sig << ", stopping gracefully...\n";
    }

    tracker.stop();
    mux.stop();

    auto ts = tracker.stats();
    std::cout << "\nSession: " << ts.ticks_processed << " ticks processed, " << ts.ticks_dropped << " dropped, "
              << ts.commits << " commits\n";
    for (const auto& [outcome, count] : ts.closes_by_outcome) {
        std::cout << "  closed " << outcome << ": " << count << "\n";
    }

    logger.stop();
    return 0;
}

int main(int argc, char* argv[]) {
    tickguard::util::install_shutdown_handler(g_running);

    CLIArgs args;
    if (!tickguard::util::parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        tickguard::util::print_help();
        return 0;
    }

    try {
        return run(args);
    } catch (const config::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
    } catch (const storage::StoreError& e) {
        std::cerr << "Store error: " << e.what() << "\n";
    } catch (const venue::VenueError& e) {
        std::cerr << "Venue error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
    }
    return 1;
}
