#include "../../include/tickguard/storage/memory_store.hpp"

#include <algorithm>

namespace tickguard::storage {

namespace {

bool matches_key(const trading::Trade& t, const risk::AssetKey& key) {
    return t.symbol == key.symbol && t.direction == key.direction && t.signal_source == key.source;
}

} // namespace

// =============================================================================
// Trades
// =============================================================================

trading::Trade MemoryTradeStore::insert_trade(trading::Trade trade) {
    mutate([&](State& s, Undo& undo) {
        if (trade.id != 0 && s.trades.count(trade.id)) {
            throw StoreError("Trade id already exists: " + std::to_string(trade.id));
        }
        if (!trade.identifier.empty()) {
            for (const auto& [id, existing] : s.trades) {
                if (existing.identifier == trade.identifier) {
                    throw StoreError("Trade identifier already exists: " + trade.identifier);
                }
            }
        }
        if (trade.id == 0) {
            trade.id = s.next_id;
        }
        undo.touch_trade(s, trade.id);
        s.next_id = std::max(s.next_id, trade.id + 1);
        s.trades[trade.id] = trade;
    });
    return trade;
}

std::optional<trading::Trade> MemoryTradeStore::find_trade(TradeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.trades.find(id);
    if (it == state_.trades.end())
        return std::nullopt;
    return it->second;
}

std::vector<trading::Trade> MemoryTradeStore::load_active_trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<trading::Trade> result;
    for (const auto& [id, trade] : state_.trades) {
        if (trade.is_active())
            result.push_back(trade);
    }
    return result;
}

std::vector<trading::Trade> MemoryTradeStore::recent_completed_trades(const risk::AssetKey& key, size_t limit,
                                                                      Timestamp since) const {
    std::vector<trading::Trade> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, trade] : state_.trades) {
            if (trade.status != TradeStatus::Completed || !matches_key(trade, key))
                continue;
            Timestamp done = trade.completed_at.value_or(trade.entry_time);
            if (done < since)
                continue;
            result.push_back(trade);
        }
    }

    // Newest first; ties broken by id so ordering is deterministic
    std::sort(result.begin(), result.end(), [](const trading::Trade& a, const trading::Trade& b) {
        Timestamp ta = a.completed_at.value_or(a.entry_time);
        Timestamp tb = b.completed_at.value_or(b.entry_time);
        if (ta != tb)
            return ta > tb;
        return a.id > b.id;
    });

    if (result.size() > limit)
        result.resize(limit);
    return result;
}

// =============================================================================
// Milestones
// =============================================================================

std::optional<trading::MilestoneRecord> MemoryTradeStore::find_milestone(TradeId trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.milestones.find(trade_id);
    if (it == state_.milestones.end())
        return std::nullopt;
    return it->second;
}

bool MemoryTradeStore::insert_milestone(const trading::MilestoneRecord& record) {
    bool inserted = false;
    mutate([&](State& s, Undo& undo) {
        if (s.milestones.count(record.trade_id))
            return;
        undo.touch_milestone(s, record.trade_id);
        s.milestones[record.trade_id] = record;
        inserted = true;
    });
    return inserted;
}

// =============================================================================
// Price samples
// =============================================================================

std::vector<trading::PriceSample> MemoryTradeStore::price_samples(TradeId trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.samples.find(trade_id);
    if (it == state_.samples.end())
        return {};
    return it->second;
}

size_t MemoryTradeStore::delete_price_samples(TradeId trade_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.samples.find(trade_id);
    if (it == state_.samples.end())
        return 0;
    erase_samples(trade_id);
    size_t removed = it->second.size();
    state_.samples.erase(it);
    return removed;
}

// =============================================================================
// Asset health
// =============================================================================

std::optional<risk::AssetHealthRecord> MemoryTradeStore::find_asset_health(const risk::AssetKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.asset_health.find(key.to_string());
    if (it == state_.asset_health.end())
        return std::nullopt;
    return it->second;
}

void MemoryTradeStore::save_asset_health(const risk::AssetHealthRecord& record) {
    mutate([&](State& s, Undo& undo) {
        std::string key = record.key.to_string();
        undo.touch_asset_health(s, key);
        s.asset_health[key] = record;
    });
}

std::vector<risk::AssetHealthRecord> MemoryTradeStore::all_asset_health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<risk::AssetHealthRecord> result;
    result.reserve(state_.asset_health.size());
    for (const auto& [k, record] : state_.asset_health) {
        result.push_back(record);
    }
    return result;
}

// =============================================================================
// Batch commit
// =============================================================================

void MemoryTradeStore::commit_batch(const Batch& batch) {
    if (batch.empty())
        return;
    std::lock_guard<std::mutex> lock(mutex_);

    // Samples first: a failed append leaves nothing to undo
    if (!batch.samples.empty())
        append_samples(batch.samples);

    Undo undo;
    undo.next_id = state_.next_id;
    for (const auto& trade : batch.trades) {
        undo.touch_trade(state_, trade.id);
        state_.trades[trade.id] = trade;
        state_.next_id = std::max(state_.next_id, trade.id + 1);
    }
    for (const auto& record : batch.milestones) {
        undo.touch_milestone(state_, record.trade_id);
        state_.milestones[record.trade_id] = record;
    }

    if (undo.dirty()) {
        try {
            write_snapshot(state_);
        } catch (const std::exception&) {
            undo.restore(state_);
            if (!batch.samples.empty())
                revert_samples();
            throw;
        }
    }

    for (const auto& sample : batch.samples) {
        state_.samples[sample.trade_id].push_back(sample);
    }
}

// =============================================================================
// Undo
// =============================================================================

void MemoryTradeStore::Undo::touch_trade(const State& s, TradeId id) {
    if (trades.count(id))
        return;
    auto it = s.trades.find(id);
    trades[id] = it == s.trades.end() ? std::nullopt : std::optional<trading::Trade>(it->second);
}

void MemoryTradeStore::Undo::touch_milestone(const State& s, TradeId id) {
    if (milestones.count(id))
        return;
    auto it = s.milestones.find(id);
    milestones[id] = it == s.milestones.end() ? std::nullopt : std::optional<trading::MilestoneRecord>(it->second);
}

void MemoryTradeStore::Undo::touch_asset_health(const State& s, const std::string& key) {
    if (asset_health.count(key))
        return;
    auto it = s.asset_health.find(key);
    asset_health[key] =
        it == s.asset_health.end() ? std::nullopt : std::optional<risk::AssetHealthRecord>(it->second);
}

void MemoryTradeStore::Undo::restore(State& s) const {
    for (const auto& [id, prior] : trades) {
        if (prior)
            s.trades[id] = *prior;
        else
            s.trades.erase(id);
    }
    for (const auto& [id, prior] : milestones) {
        if (prior)
            s.milestones[id] = *prior;
        else
            s.milestones.erase(id);
    }
    for (const auto& [key, prior] : asset_health) {
        if (prior)
            s.asset_health[key] = *prior;
        else
            s.asset_health.erase(key);
    }
    s.next_id = next_id;
}

size_t MemoryTradeStore::trade_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.trades.size();
}

size_t MemoryTradeStore::milestone_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.milestones.size();
}

size_t MemoryTradeStore::sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [id, samples] : state_.samples)
        n += samples.size();
    return n;
}

} // namespace tickguard::storage
