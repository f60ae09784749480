/*
Tidewatch — MetadataEnricher
Role: Cache, batching and debounce logic for market imagery lookups.
Related: MetadataEnricher.hpp.
*/
#include "MetadataEnricher.hpp"
#include "TidewatchLogging.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>

namespace net = boost::asio;

MetadataEnricher::MetadataEnricher(Strand strand,
                                   std::shared_ptr<IMetadataSource> source,
                                   std::size_t batchSize,
                                   std::chrono::milliseconds debounce)
    : m_strand(std::move(strand))
    , m_source(std::move(source))
    , m_batchSize(batchSize > 0 ? batchSize : 1)
    , m_debounce(debounce)
    , m_debounceTimer(m_strand)
{}

std::optional<std::string> MetadataEnricher::resolve(const std::string& marketSlug,
                                                    const std::string& conditionId) {
    if (auto img = cachedImage(marketSlug, conditionId)) return img;
    if (m_stopped || !m_source) return std::nullopt;

    if (!marketSlug.empty()) queueKey(slugKey(marketSlug));
    if (!conditionId.empty()) queueKey(conditionKey(conditionId));
    return std::nullopt;
}

std::optional<std::string> MetadataEnricher::cachedImage(const std::string& marketSlug,
                                                         const std::string& conditionId) const {
    for (const auto& key : {slugKey(marketSlug), conditionKey(conditionId)}) {
        auto it = m_cache.find(key);
        if (it != m_cache.end() && it->second) return it->second;
    }
    return std::nullopt;
}

void MetadataEnricher::start() {
    m_stopped = false;
}

void MetadataEnricher::stop() {
    m_stopped = true;
    ++m_timerGeneration;
    m_timerArmed = false;
    m_debounceTimer.cancel();
    // Completions are dropped while stopped, so nothing queued or in flight would ever
    // settle; forget those keys and let the next resolve() queue them again.
    m_pending.clear();
    m_pendingSet.clear();
    m_inFlight.clear();
}

MetadataEnricher::KeyState MetadataEnricher::state(const std::string& key) const {
    if (auto it = m_cache.find(key); it != m_cache.end()) {
        return it->second ? KeyState::Present : KeyState::Negative;
    }
    if (m_inFlight.count(key)) return KeyState::InFlight;
    if (m_pendingSet.count(key)) return KeyState::Pending;
    return KeyState::Unknown;
}

void MetadataEnricher::queueKey(const std::string& key) {
    if (m_cache.count(key) || m_pendingSet.count(key) || m_inFlight.count(key)) return;

    m_pending.push_back(key);
    m_pendingSet.insert(key);

    if (m_pending.size() >= m_batchSize) {
        flushPending();
    } else {
        armDebounce();
    }
}

void MetadataEnricher::armDebounce() {
    if (m_timerArmed) return;
    m_timerArmed = true;
    const uint64_t generation = ++m_timerGeneration;
    m_debounceTimer.expires_after(m_debounce);
    m_debounceTimer.async_wait([weak = weak_from_this(), generation](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || self->m_stopped || generation != self->m_timerGeneration) return;
        self->flushPending();
    });
}

void MetadataEnricher::flushPending() {
    ++m_timerGeneration;
    m_timerArmed = false;
    m_debounceTimer.cancel();
    if (m_pending.empty()) return;

    std::vector<std::string> keys;
    keys.swap(m_pending);
    m_pendingSet.clear();

    MetadataRequest request;
    for (const auto& key : keys) {
        m_inFlight.insert(key);
        if (key.rfind("cond:", 0) == 0) {
            request.conditionIds.push_back(key.substr(5));
        } else if (key.rfind("slug:", 0) == 0) {
            request.eventSlugs.push_back(key.substr(5));
        }
    }

    ++m_requestsSent;
    tLog_Data("Metadata batch requested:" << static_cast<int>(keys.size()) << "keys");

    m_source->fetch(std::move(request),
        [weak = weak_from_this(), strand = m_strand, keys](MetadataResponse response) mutable {
            net::post(strand, [weak, keys = std::move(keys), response = std::move(response)]() {
                auto self = weak.lock();
                if (!self || self->m_stopped) return;
                self->handleResponse(keys, response);
            });
        });
}

void MetadataEnricher::handleResponse(const std::vector<std::string>& keys, const MetadataResponse& response) {
    if (!response.ok) {
        tLog_Warning("Metadata lookup failed:" << QString::fromStdString(response.error)
                     << "- caching" << static_cast<int>(keys.size()) << "keys as negative");
    } else {
        for (const auto& m : response.markets) {
            if (!m.slug.empty()) cacheIfAbsent(slugKey(m.slug), m.image);
            if (!m.marketSlug.empty()) cacheIfAbsent(slugKey(m.marketSlug), m.image);
            if (!m.eventSlug.empty()) cacheIfAbsent(slugKey(m.eventSlug), m.image);
            if (!m.conditionId.empty()) cacheIfAbsent(conditionKey(m.conditionId), m.image);
        }
    }

    // Anything requested but not answered is negative.
    for (const auto& key : keys) {
        m_inFlight.erase(key);
        cacheIfAbsent(key, std::nullopt);
    }

    if (m_onBatchComplete) m_onBatchComplete();
}

void MetadataEnricher::cacheIfAbsent(const std::string& key, const std::optional<std::string>& image) {
    if (m_cache.count(key)) return;
    m_cache.emplace(key, image);
    // A key answered by another batch no longer needs its own request.
    if (m_pendingSet.erase(key)) {
        m_pending.erase(std::remove(m_pending.begin(), m_pending.end(), key), m_pending.end());
    }
}
