#include "SignalDetector.hpp"
#include "TidewatchLogging.hpp"
#include <exception>

SignalDetector::SignalDetector()
    : SignalDetector(Thresholds{})
{}

SignalDetector::SignalDetector(const Thresholds& t) {
    m_rules.push_back(std::make_unique<FreshWalletRule>(t.freshWalletMaxAgeSeconds, t.freshWalletMinNotional));
    m_rules.push_back(std::make_unique<UnusualSizingRule>(t.unusualSizingMultiple));
    m_rules.push_back(std::make_unique<RepeatedEntriesRule>(t.repeatedEntriesThreshold));
    m_rules.push_back(std::make_unique<RapidClusteringRule>(t.rapidClusterCount, t.rapidClusterWindowSeconds));
}

std::vector<AnomalySignal> SignalDetector::detect(const Trade& trade, const WalletProfile* profile) const {
    std::vector<AnomalySignal> signals;
    if (!profile) return signals;

    try {
        const ProfileAsOf view = ProfileAsOf::build(trade, *profile);
        for (const auto& rule : m_rules) {
            if (auto s = rule->check(trade, view)) {
                signals.push_back(std::move(*s));
            }
        }
    } catch (const std::exception& e) {
        tLog_Warning(QString("Signal detection failed for %1: %2")
                         .arg(QString::fromStdString(trade.identity()))
                         .arg(QString::fromUtf8(e.what())));
        signals.clear();
    }
    return signals;
}
