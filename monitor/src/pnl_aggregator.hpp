#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "solana_tracker_client.hpp"
#include "state_store.hpp"
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

enum class RefreshOutcome {
    Started,
    AlreadyRunning,
    Disabled
};

std::string outcome_string(RefreshOutcome outcome);

struct PnlPacing {
    std::chrono::milliseconds request_spacing{1100};
    std::chrono::milliseconds retry_backoff{2000};
};

// Sums token PnL across every tracked wallet.
class PnlAggregator {
public:
    // source may be null, in which case refreshes report Disabled.
    PnlAggregator(StateStore& store,
                  std::shared_ptr<PnlSource> source,
                  std::shared_ptr<Clock> clock,
                  PnlPacing pacing = {});
    ~PnlAggregator();

    PnlAggregator(const PnlAggregator&) = delete;
    PnlAggregator& operator=(const PnlAggregator&) = delete;

    bool enabled() const { return source_ != nullptr; }

    // Starts a refresh on a background thread unless one is already running.
    RefreshOutcome request_refresh();

    // Runs a refresh on the calling thread. Empty when disabled or already running.
    std::optional<PnlSnapshot> refresh_now();

    bool running() const { return running_; }
    std::optional<TimePoint> last_run() const;

    // Waits for a background refresh to finish.
    void join();

    // Stops a refresh in flight between wallets and refuses new ones.
    // Wallets not reached keep their cached records and are reported failed.
    void cancel();
    bool cancelled() const { return cancelled_; }

    static AggregatePnl compute_aggregate(const std::vector<WalletPnlRecord>& records,
                                          TimePoint run_at);

    // A record is stale when it was not fetched in this run, or when it carries
    // nothing but zeros and no trade time.
    static bool is_stale(const WalletPnlRecord& record, TimePoint run_at);

private:
    StateStore& store_;
    std::shared_ptr<PnlSource> source_;
    std::shared_ptr<Clock> clock_;
    PnlPacing pacing_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::mutex thread_mutex_;
    std::thread worker_;

    mutable std::mutex mutex_;
    std::optional<TimePoint> last_run_;

    PnlSnapshot run();
    std::vector<std::string> fetch_pass(const std::vector<std::string>& wallets,
                                        const std::string& token,
                                        TimePoint run_at,
                                        std::vector<WalletPnlRecord>& records);
};
