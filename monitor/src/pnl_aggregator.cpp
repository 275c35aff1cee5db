#include "pnl_aggregator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

// Clears the running flag however the refresh ends
struct RunningGuard {
    std::atomic<bool>& flag;
    ~RunningGuard() { flag = false; }
};

} // namespace

std::string outcome_string(RefreshOutcome outcome) {
    switch (outcome) {
        case RefreshOutcome::Started: return "started";
        case RefreshOutcome::AlreadyRunning: return "already running";
        case RefreshOutcome::Disabled: return "disabled";
        default: return "unknown";
    }
}

PnlAggregator::PnlAggregator(StateStore& store,
                             std::shared_ptr<PnlSource> source,
                             std::shared_ptr<Clock> clock,
                             PnlPacing pacing)
    : store_(store)
    , source_(std::move(source))
    , clock_(std::move(clock))
    , pacing_(pacing)
{
    auto previous = store_.pnl_snapshot();
    if (previous) {
        last_run_ = previous->run_at;
    }
}

PnlAggregator::~PnlAggregator() {
    cancel();
    join();
}

void PnlAggregator::cancel() {
    if (!cancelled_.exchange(true) && running_) {
        spdlog::info("Cancelling PnL refresh in flight");
    }
}

void PnlAggregator::join() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<TimePoint> PnlAggregator::last_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_run_;
}

RefreshOutcome PnlAggregator::request_refresh() {
    if (!enabled() || cancelled_) {
        return RefreshOutcome::Disabled;
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        spdlog::info("PnL refresh already running, request skipped");
        return RefreshOutcome::AlreadyRunning;
    }

    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread([this] {
        RunningGuard guard{running_};
        try {
            run();
        } catch (const std::exception& e) {
            spdlog::error("PnL refresh failed: {}", e.what());
        }
    });
    return RefreshOutcome::Started;
}

std::optional<PnlSnapshot> PnlAggregator::refresh_now() {
    if (!enabled() || cancelled_) {
        return std::nullopt;
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        spdlog::info("PnL refresh already running, request skipped");
        return std::nullopt;
    }

    RunningGuard guard{running_};
    return run();
}

std::vector<std::string> PnlAggregator::fetch_pass(const std::vector<std::string>& wallets,
                                                   const std::string& token,
                                                   TimePoint run_at,
                                                   std::vector<WalletPnlRecord>& records) {
    std::vector<std::string> failed;

    for (size_t i = 0; i < wallets.size(); i++) {
        const auto& wallet = wallets[i];
        if (i > 0 && !cancelled_) {
            clock_->sleep_for(pacing_.request_spacing);
        }
        if (cancelled_) {
            failed.insert(failed.end(), wallets.begin() + i, wallets.end());
            break;
        }

        auto record = source_->wallet_pnl(wallet, token);
        if (!record) {
            failed.push_back(wallet);
            continue;
        }

        record->wallet = wallet;
        record->fetched_at = run_at;
        auto it = std::find_if(records.begin(), records.end(),
                               [&](const WalletPnlRecord& r) { return r.wallet == wallet; });
        if (it != records.end()) {
            *it = *record;
        } else {
            records.push_back(*record);
        }
    }
    return failed;
}

PnlSnapshot PnlAggregator::run() {
    auto wallets = store_.wallets();
    auto token = store_.tracked_token();
    auto run_at = clock_->now();

    spdlog::info("PnL refresh for {} wallets", wallets.size());

    // Start from the cached records so failed wallets keep their last data
    std::vector<WalletPnlRecord> records;
    auto previous = store_.pnl_snapshot();
    for (const auto& wallet : wallets) {
        if (!previous) break;
        for (const auto& record : previous->records) {
            if (record.wallet == wallet) {
                records.push_back(record);
                break;
            }
        }
    }

    auto failed = fetch_pass(wallets, token, run_at, records);

    if (!failed.empty() && !cancelled_) {
        spdlog::warn("PnL fetch failed for {} wallets, retrying in {} ms",
                     failed.size(), pacing_.retry_backoff.count());
        clock_->sleep_for(pacing_.retry_backoff);
        failed = fetch_pass(failed, token, run_at, records);
    }

    // Keep wallet-list order
    std::vector<WalletPnlRecord> ordered;
    for (const auto& wallet : wallets) {
        for (const auto& record : records) {
            if (record.wallet == wallet) {
                ordered.push_back(record);
                break;
            }
        }
    }

    PnlSnapshot snapshot;
    snapshot.run_at = run_at;
    snapshot.records = ordered;
    snapshot.aggregate = compute_aggregate(ordered, run_at);
    snapshot.aggregate.failed_wallets = failed;

    store_.store_pnl_snapshot(snapshot);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_run_ = run_at;
    }

    if (cancelled_) {
        spdlog::warn("PnL refresh cancelled, {} wallets keep cached data", failed.size());
    } else {
        for (const auto& wallet : failed) {
            spdlog::error("PnL fetch failed twice for {}, keeping cached data",
                          util::short_address(wallet));
        }
    }
    spdlog::info("PnL refresh done: value ${:.2f}, realized ${:.2f}, unrealized ${:.2f} ({} stale, {} failed)",
                 snapshot.aggregate.current_value, snapshot.aggregate.realized,
                 snapshot.aggregate.unrealized, snapshot.aggregate.stale_count, failed.size());
    return snapshot;
}

bool PnlAggregator::is_stale(const WalletPnlRecord& record, TimePoint run_at) {
    if (record.fetched_at != run_at) {
        return true;
    }
    bool all_zero = record.holding == 0.0 && record.realized == 0.0 &&
                    record.unrealized == 0.0 && record.current_value == 0.0 &&
                    record.cost_basis == 0.0;
    return all_zero && !record.last_trade_time;
}

AggregatePnl PnlAggregator::compute_aggregate(const std::vector<WalletPnlRecord>& records,
                                              TimePoint run_at) {
    AggregatePnl agg;
    double weighted_cost = 0.0;
    double held = 0.0;

    for (const auto& record : records) {
        agg.holding += record.holding;
        agg.realized += record.realized;
        agg.unrealized += record.unrealized;
        agg.current_value += record.current_value;

        if (record.holding > 0.0) {
            weighted_cost += record.cost_basis * record.holding;
            held += record.holding;
        }

        if (record.last_trade_time &&
            (!agg.last_trade_time || *record.last_trade_time > *agg.last_trade_time)) {
            agg.last_trade_time = record.last_trade_time;
        }

        if (is_stale(record, run_at)) {
            agg.stale_wallets.push_back(record.wallet);
        }
    }

    agg.cost_basis = held > 0.0 ? weighted_cost / held : 0.0;
    agg.stale_count = static_cast<int>(agg.stale_wallets.size());
    return agg;
}
