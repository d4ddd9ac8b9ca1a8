/**
 * Benchmark: tick processing latency in TradeTracker
 *
 * Measures the listener path for one instrument carrying N trades:
 * PnL, excursion, milestones, exit evaluation and batching against an
 * in-memory store. Rate limiting is disabled so every tick is processed.
 *
 * Also measures JsonFileStore commit latency early and late in a run, as
 * price samples accumulate.
 */

#include "../include/tickguard/exits/exit_evaluator.hpp"
#include "../include/tickguard/storage/json_file_store.hpp"
#include "../include/tickguard/storage/memory_store.hpp"
#include "../include/tickguard/tracking/milestone_recorder.hpp"
#include "../include/tickguard/tracking/post_trade_pipeline.hpp"
#include "../include/tickguard/tracking/trade_tracker.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <vector>
#include <unistd.h>

using namespace tickguard;

constexpr size_t WARMUP_TICKS = 1'000;
constexpr size_t BENCH_TICKS = 100'000;
constexpr Timestamp T0 = 1'700'000'000ULL * NS_PER_SEC;

// Captures the listener so ticks can be driven synchronously
class DirectTickSource : public market::ITickSource {
public:
    market::ListenerId subscribe(const std::string& instrument, market::TickListener listener) override {
        listeners_[instrument] = std::move(listener);
        return ++next_id_;
    }
    void unsubscribe(const std::string& instrument, market::ListenerId) override { listeners_.erase(instrument); }

    void emit(const std::string& instrument, double price, Timestamp ts) {
        auto it = listeners_.find(instrument);
        if (it == listeners_.end())
            return;
        // A closing trade may unsubscribe from inside the call
        market::TickListener listener = it->second;
        listener(instrument, price, ts);
    }

private:
    std::map<std::string, market::TickListener> listeners_;
    market::ListenerId next_id_ = 0;
};

class NullPipeline : public tracking::IPostTradePipeline {
public:
    void process_completed_trade(const trading::Trade&, Outcome, double) override {}
};

void print_stats(const char* name, std::vector<uint64_t>& samples) {
    std::sort(samples.begin(), samples.end());
    auto pct = [&samples](double p) { return samples[static_cast<size_t>(p * (samples.size() - 1))]; };
    double mean = 0;
    for (auto s : samples)
        mean += static_cast<double>(s);
    mean /= static_cast<double>(samples.size());

    std::cout << std::fixed << std::setprecision(1);
    std::cout << name << ":\n";
    std::cout << "  Count: " << samples.size() << " ticks\n";
    std::cout << "  Mean:  " << mean << " ns\n";
    std::cout << "  P50:   " << pct(0.50) << " ns\n";
    std::cout << "  P90:   " << pct(0.90) << " ns\n";
    std::cout << "  P99:   " << pct(0.99) << " ns\n";
    std::cout << "  Max:   " << samples.back() << " ns\n";
    std::cout << "\n";
}

void bench_trades_per_instrument(size_t trade_count, RiskStrategy strategy) {
    DirectTickSource source;
    storage::MemoryTradeStore store;
    logging::AsyncLogger logger;
    logger.set_min_level(logging::LogLevel::Error);
    tracking::MilestoneRecorder milestones(store, logger);
    exits::ExitEvaluatorTable exits;
    NullPipeline pipeline;

    config::TrackerSettings settings;
    settings.tick_process_interval_ms = 0;
    settings.commit_interval_ms = 5'000;

    tracking::TradeTracker tracker(source, store, milestones, exits, pipeline, settings, logger);

    for (size_t i = 0; i < trade_count; ++i) {
        trading::Trade t;
        t.identifier = "#BENCH_" + std::to_string(i);
        t.symbol = "BTCUSDT";
        t.signal_source = "bench";
        t.entry_price = 50'000.0;
        t.entry_time = T0;
        t.risk_strategy = strategy;
        t.tp[0].pct = 50.0; // out of reach
        t.tp[1].pct = 60.0;
        t.tp[2].pct = 70.0;
        t.planned_sl_pct = -50.0;
        t.trailing_activation_pct = 40.0;
        t.trailing_distance_pct = 2.0;
        tracker.add_trade(std::move(t));
    }

    std::mt19937 rng(42);
    std::normal_distribution<double> move(0.0, 5.0);
    double price = 50'000.0;

    for (size_t i = 0; i < WARMUP_TICKS; ++i) {
        price += move(rng);
        source.emit("BTC/USDT", price, T0 + i * NS_PER_SEC);
    }

    std::vector<uint64_t> samples;
    samples.reserve(BENCH_TICKS);
    for (size_t i = 0; i < BENCH_TICKS; ++i) {
        price += move(rng);
        Timestamp ts = T0 + (WARMUP_TICKS + i) * NS_PER_SEC;

        auto start = std::chrono::steady_clock::now();
        source.emit("BTC/USDT", price, ts);
        auto end = std::chrono::steady_clock::now();

        samples.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    }

    std::string name = std::to_string(trade_count) + " trades, " + risk_strategy_to_string(strategy);
    print_stats(name.c_str(), samples);

    tracker.stop();
}

void bench_file_store_commits() {
    constexpr size_t TRADES = 20;
    constexpr size_t COMMITS = 500;
    constexpr size_t WINDOW = 50;

    std::string path = "/tmp/tickguard_bench_" + std::to_string(::getpid()) + ".json";
    {
        storage::JsonFileStore store(path);
        std::vector<trading::Trade> trades;
        for (size_t i = 0; i < TRADES; ++i) {
            trading::Trade t;
            t.identifier = "#STORE_" + std::to_string(i);
            t.symbol = "BTCUSDT";
            t.signal_source = "bench";
            t.entry_price = 50'000.0;
            t.entry_time = T0;
            trades.push_back(store.insert_trade(std::move(t)));
        }

        // One tracker commit: every trade dirty plus five samples each
        std::vector<uint64_t> samples;
        samples.reserve(COMMITS);
        for (size_t c = 0; c < COMMITS; ++c) {
            storage::Batch batch;
            for (auto& t : trades) {
                t.max_profit_pct = static_cast<double>(c % 10) * 0.1;
                batch.trades.push_back(t);
                for (size_t k = 0; k < 5; ++k) {
                    trading::PriceSample s;
                    s.trade_id = t.id;
                    s.timestamp = T0 + (c * 5 + k) * NS_PER_SEC;
                    s.price = 50'000.0 + static_cast<double>(k);
                    batch.samples.push_back(s);
                }
            }

            auto start = std::chrono::steady_clock::now();
            store.commit_batch(batch);
            auto end = std::chrono::steady_clock::now();
            samples.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
        }

        std::vector<uint64_t> first(samples.begin(), samples.begin() + WINDOW);
        std::vector<uint64_t> last(samples.end() - WINDOW, samples.end());
        print_stats("JsonFileStore commit, first 50", first);
        print_stats("JsonFileStore commit, last 50 (50k samples retained)", last);
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove_all(path + ".samples", ec);
}

int main() {
    std::cout << "=== TradeTracker Tick Processing Benchmark ===\n\n";

    bench_trades_per_instrument(1, RiskStrategy::Static);
    bench_trades_per_instrument(10, RiskStrategy::Static);
    bench_trades_per_instrument(10, RiskStrategy::AdaptiveTrailing);
    bench_trades_per_instrument(100, RiskStrategy::EarlyMomentum);
    bench_file_store_commits();

    return 0;
}
