#pragma once

/**
 * Post-trade pipeline - output boundary of the tracker.
 *
 * Called once per closed trade after it has been persisted. Implementations
 * must not throw; the tracker still guards the call and logs any escape.
 */

#include "../logging/async_logger.hpp"
#include "../risk/circuit_breaker.hpp"
#include "../storage/trade_store.hpp"
#include "../trading/trade.hpp"

namespace tickguard {
namespace tracking {

class IPostTradePipeline {
public:
    virtual ~IPostTradePipeline() = default;

    virtual void process_completed_trade(const trading::Trade& trade, Outcome outcome, double final_pnl_pct) = 0;
};

/**
 * Default pipeline: circuit breaker update, then price sample cleanup.
 * A failing step is logged and does not stop the next one.
 */
class DefaultPostTradePipeline : public IPostTradePipeline {
public:
    DefaultPostTradePipeline(risk::CircuitBreaker& breaker, storage::ITradeStore& store, logging::AsyncLogger& logger)
        : breaker_(breaker), store_(store), logger_(logger) {}

    void process_completed_trade(const trading::Trade& trade, Outcome outcome, double final_pnl_pct) override;

private:
    risk::CircuitBreaker& breaker_;
    storage::ITradeStore& store_;
    logging::AsyncLogger& logger_;
};

} // namespace tracking
} // namespace tickguard
