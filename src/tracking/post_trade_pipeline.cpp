#include "../../include/tickguard/tracking/post_trade_pipeline.hpp"

namespace tickguard::tracking {

void DefaultPostTradePipeline::process_completed_trade(const trading::Trade& trade, Outcome outcome,
                                                       double final_pnl_pct) {
    TICKGUARD_LOGF(logger_, Info, Exit, "Post-trade %s %s %s P&L %+.2f%%", trade.identifier.c_str(),
                   trade.symbol.c_str(), outcome_to_string(outcome), final_pnl_pct);

    risk::AssetKey key{trade.symbol, trade.direction, trade.signal_source};
    Timestamp now = trade.completed_at.value_or(trade.entry_time);

    try {
        breaker_.on_trade_completed(key, now);
    } catch (const std::exception& e) {
        TICKGUARD_LOGF(logger_, Error, Risk, "Circuit breaker update failed for %s: %s", key.to_string().c_str(),
                       e.what());
    }

    try {
        size_t removed = store_.delete_price_samples(trade.id);
        TICKGUARD_LOGF(logger_, Debug, Store, "Deleted %zu price samples for %s", removed, trade.identifier.c_str());
    } catch (const std::exception& e) {
        TICKGUARD_LOGF(logger_, Error, Store, "Price sample cleanup failed for %s: %s", trade.identifier.c_str(),
                       e.what());
    }
}

} // namespace tickguard::tracking
