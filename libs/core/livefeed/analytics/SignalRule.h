#ifndef TIDEWATCH_SIGNALRULE_H
#define TIDEWATCH_SIGNALRULE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include "../model/PipelineTypes.h"
#include "../model/TradeData.h"
#include "WalletActivityTracker.hpp"

/**
 * @brief A wallet profile seen "as of" one trade.
 *
 * History entries recorded after the trade are excluded, and the prior* figures
 * exclude the trade itself. When the trade is not in the profile's history the
 * whole profile counts as prior activity.
 */
struct ProfileAsOf {
    const WalletProfile* profile = nullptr;
    std::size_t historyEnd = 0;          // entries [0, historyEnd) precede the trade
    std::size_t priorCount = 0;
    double      priorVolume = 0.0;
    std::size_t priorMarketEntries = 0;

    [[nodiscard]] double priorAverage() const {
        return priorCount > 0 ? priorVolume / static_cast<double>(priorCount) : 0.0;
    }

    static ProfileAsOf build(const Trade& trade, const WalletProfile& profile);
};

/**
 * @class SignalRule
 * @brief Abstract base for one anomaly heuristic.
 *
 * check() returns the signal when the heuristic fires for the trade, nullopt otherwise.
 */
class SignalRule
{
public:
    virtual ~SignalRule() = default;

    virtual std::optional<AnomalySignal> check(const Trade& trade, const ProfileAsOf& view) const = 0;

    virtual SignalType type() const = 0;
};

class FreshWalletRule : public SignalRule
{
public:
    FreshWalletRule(int64_t maxAgeSeconds, double minNotional)
        : m_maxAgeSeconds(maxAgeSeconds), m_minNotional(minNotional) {}

    std::optional<AnomalySignal> check(const Trade& trade, const ProfileAsOf& view) const override;
    SignalType type() const override { return SignalType::FreshWallet; }

private:
    int64_t m_maxAgeSeconds;
    double  m_minNotional;
};

class UnusualSizingRule : public SignalRule
{
public:
    explicit UnusualSizingRule(double multiple) : m_multiple(multiple) {}

    std::optional<AnomalySignal> check(const Trade& trade, const ProfileAsOf& view) const override;
    SignalType type() const override { return SignalType::UnusualSizing; }

private:
    double m_multiple;
};

class RepeatedEntriesRule : public SignalRule
{
public:
    explicit RepeatedEntriesRule(std::size_t priorEntries) : m_priorEntries(priorEntries) {}

    std::optional<AnomalySignal> check(const Trade& trade, const ProfileAsOf& view) const override;
    SignalType type() const override { return SignalType::RepeatedEntries; }

private:
    std::size_t m_priorEntries;
};

class RapidClusteringRule : public SignalRule
{
public:
    RapidClusteringRule(std::size_t minTrades, int64_t windowSeconds)
        : m_minTrades(minTrades), m_windowSeconds(windowSeconds) {}

    std::optional<AnomalySignal> check(const Trade& trade, const ProfileAsOf& view) const override;
    SignalType type() const override { return SignalType::RapidClustering; }

private:
    std::size_t m_minTrades;
    int64_t     m_windowSeconds;
};

#endif // TIDEWATCH_SIGNALRULE_H
