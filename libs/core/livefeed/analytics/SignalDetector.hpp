/*
Tidewatch — SignalDetector
Role: Runs the anomaly heuristics (fresh wallet, unusual sizing, repeated entries, rapid clustering) for one trade.
Inputs/Outputs: (Trade, WalletProfile*) → list of AnomalySignal, in rule order.
Threading: Stateless after construction; detect() is const and safe from any thread given a stable profile.
Integration: Called by LiveTradesPipeline for the view's signal filter and for signalsFor().
Observability: Unexpected exceptions inside a rule are logged and yield no signals.
Related: SignalRule.h, WalletActivityTracker.hpp.
Assumptions: Signals are recomputed on demand and never decay or persist.
*/
#pragma once
#include <memory>
#include <vector>
#include "SignalRule.h"

class SignalDetector {
public:
    struct Thresholds {
        int64_t     freshWalletMaxAgeSeconds = 24 * 60 * 60;
        double      freshWalletMinNotional = 500.0;
        double      unusualSizingMultiple = 3.0;
        std::size_t repeatedEntriesThreshold = 3;
        std::size_t rapidClusterCount = 3;
        int64_t     rapidClusterWindowSeconds = 30 * 60;
    };

    SignalDetector();
    explicit SignalDetector(const Thresholds& thresholds);

    // Never throws; a null profile yields no signals.
    [[nodiscard]] std::vector<AnomalySignal> detect(const Trade& trade, const WalletProfile* profile) const;

private:
    std::vector<std::unique_ptr<SignalRule>> m_rules;
};
