#pragma once

/**
 * JsonFileStore - ITradeStore persisted as a JSON snapshot plus per-trade
 * price sample logs.
 *
 * Layout:
 *   <path>                         trades, milestones, asset health
 *   <path>.samples/<trade_id>.jsonl  one price sample per line, append-only
 *
 * Snapshot changes are written to "<path>.tmp" and renamed over the target
 * (atomic on POSIX). Samples are appended to their trade's log, so the cost
 * of a commit follows the batch, not the samples already stored. A trade's
 * log is removed by delete_price_samples(). A failed write leaves the files
 * and the in-memory state untouched and raises StoreError.
 *
 * Usage:
 *   JsonFileStore store("tickguard_state.json");
 *   store.load();            // no-op when the file does not exist yet
 *   store.insert_trade(t);
 */

#include "memory_store.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace tickguard {
namespace storage {

class JsonFileStore : public MemoryTradeStore {
public:
    static constexpr const char* DEFAULT_PATH = "tickguard_state.json";
    static constexpr int FORMAT_VERSION = 2;

    explicit JsonFileStore(std::string path = DEFAULT_PATH);

    /**
     * Load state from disk. Returns false if the file does not exist.
     * @throws StoreError if the file exists but cannot be parsed
     */
    bool load();

    bool exists() const;
    const std::string& path() const { return path_; }
    std::string samples_dir() const { return path_ + ".samples"; }
    std::string samples_path(TradeId trade_id) const;

protected:
    void write_snapshot(const State& state) override;
    void append_samples(const std::vector<trading::PriceSample>& samples) override;
    void revert_samples() noexcept override;
    void erase_samples(TradeId trade_id) override;

private:
    void load_samples(State& state) const;

    std::string path_;
    // Log sizes before the last append_samples(), for revert_samples()
    std::map<TradeId, uintmax_t> appended_from_;
};

} // namespace storage
} // namespace tickguard
