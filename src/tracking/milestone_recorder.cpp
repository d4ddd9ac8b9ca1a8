#include "../../include/tickguard/tracking/milestone_recorder.hpp"

#include <cstdio>
#include <string>

namespace tickguard::tracking {

namespace {

void append_threshold(std::string& out, double threshold) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), " %+.1f%%", threshold);
    out += buf;
}

} // namespace

trading::MilestoneRecord MilestoneRecorder::ensure_record(const trading::Trade& trade) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(trade.id);
        if (it != cache_.end())
            return it->second;
    }

    std::optional<trading::MilestoneRecord> record = store_.find_milestone(trade.id);
    if (!record) {
        trading::MilestoneRecord fresh;
        fresh.trade_id = trade.id;
        fresh.entry_price = trade.entry_price.value_or(0.0);
        fresh.entry_at = trade.entry_time;
        if (!store_.insert_milestone(fresh)) {
            // Already written by a batch commit; reload it
            record = store_.find_milestone(trade.id);
        }
        if (!record) {
            record = fresh;
            TICKGUARD_LOGF(logger_, Info, Milestone, "Created milestone tracking for trade %lld",
                           static_cast<long long>(trade.id));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = cache_.try_emplace(trade.id, *record);
    return it->second;
}

trading::MilestoneRecord MilestoneRecorder::update_milestones(const trading::Trade& trade, double pnl_pct,
                                                              Timestamp timestamp) {
    ensure_record(trade);

    std::lock_guard<std::mutex> lock(mutex_);
    trading::MilestoneRecord& record = cache_[trade.id];

    std::string reached;
    for (size_t i = 0; i < trading::MILESTONE_COUNT; ++i) {
        if (pnl_pct >= trading::PROFIT_MILESTONES[i] && !record.reached_profit[i]) {
            record.reached_profit[i] = timestamp;
            append_threshold(reached, trading::PROFIT_MILESTONES[i]);
        }
        if (pnl_pct <= trading::DRAWDOWN_MILESTONES[i] && !record.reached_drawdown[i]) {
            record.reached_drawdown[i] = timestamp;
            append_threshold(reached, trading::DRAWDOWN_MILESTONES[i]);
        }
    }

    if (!record.max_profit_pct || pnl_pct > *record.max_profit_pct) {
        record.max_profit_pct = pnl_pct;
        record.max_profit_at = timestamp;
    }
    if (!record.max_drawdown_pct || pnl_pct < *record.max_drawdown_pct) {
        record.max_drawdown_pct = pnl_pct;
        record.max_drawdown_at = timestamp;
    }

    if (!reached.empty()) {
        TICKGUARD_LOGF(logger_, Debug, Milestone, "Trade %lld reached milestones:%s",
                       static_cast<long long>(trade.id), reached.c_str());
    }
    return record;
}

trading::MilestoneRecord MilestoneRecorder::finalize(const trading::Trade& trade, double exit_price,
                                                     Timestamp exit_at, double final_pnl_pct) {
    ensure_record(trade);

    std::lock_guard<std::mutex> lock(mutex_);
    trading::MilestoneRecord& record = cache_[trade.id];
    record.exit_price = exit_price;
    record.exit_at = exit_at;
    record.final_pnl_pct = final_pnl_pct;
    return record;
}

void MilestoneRecorder::clear_cache(TradeId trade_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(trade_id);
}

void MilestoneRecorder::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t MilestoneRecorder::cached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::optional<trading::MilestoneRecord> MilestoneRecorder::cached(TradeId trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(trade_id);
    if (it == cache_.end())
        return std::nullopt;
    return it->second;
}

} // namespace tickguard::tracking
