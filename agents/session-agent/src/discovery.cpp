#include "../include/discovery.hpp"
#include "../../../shared/cpp/bridge_sdk/include/log.hpp"
#include "../../../shared/cpp/bridge_sdk/include/util.hpp"

namespace {
const Logger log_("discovery");
}

Discovery::Discovery(AgentTransport& transport, CacheStore& cache, DiscoveryOptions opts, Clock clock)
    : transport_(transport), cache_(cache), opts_(opts), clock_(clock ? std::move(clock) : Clock(now_ms)) {}

std::optional<BridgeCacheEntry> Discovery::load_fresh_cache() {
    try {
        auto entry = cache_.load();
        if (entry && clock_() - entry->discovered_at < opts_.cache_ttl_ms) return entry;
    } catch (const std::exception& e) {
        log_.warn("Cache read failed", {{"error", e.what()}});
    }
    return std::nullopt;
}

std::optional<BridgeCacheEntry> Discovery::discover() {
    if (auto cached = load_fresh_cache()) {
        auto h = transport_.health(cached->port, opts_.health_timeout_ms);
        if (h && h->ok) return cached;
        log_.debug("Cached port no longer answers, re-probing", {{"port", cached->port}});
    }

    for (int i = 0; i < opts_.range_size; ++i) {
        const int port = opts_.range_start + i;
        if (!is_valid_port(port)) continue;
        auto h = transport_.health(port, opts_.health_timeout_ms);
        if (!h || !h->ok || h->token.empty()) continue;

        BridgeCacheEntry entry;
        entry.port = h->port > 0 ? h->port : port;
        entry.token = h->token;
        entry.discovered_at = clock_();
        try {
            cache_.save(entry);
        } catch (const std::exception& e) {
            log_.warn("Cache write failed", {{"error", e.what()}});
        }
        log_.info("Discovered bridge server", {{"port", entry.port}});
        return entry;
    }
    return std::nullopt;
}

void Discovery::invalidate() {
    try {
        cache_.clear();
    } catch (const std::exception& e) {
        log_.warn("Cache clear failed", {{"error", e.what()}});
    }
}
