#pragma once
#include "agent_transport.hpp"
#include "cache_store.hpp"
#include <cstdint>
#include <functional>
#include <optional>

struct DiscoveryOptions {
    int range_start{7890};
    int range_size{10};
    long health_timeout_ms{1000};
    int64_t cache_ttl_ms{60000};
};

// Locates a live ControlServer: revalidates a fresh cache entry with one
// health check, otherwise checks the port range in order. Checking is
// sequential, so a cold miss costs at most range_size * health_timeout_ms.
class Discovery {
public:
    using Clock = std::function<int64_t()>; // ms since epoch

    Discovery(AgentTransport& transport, CacheStore& cache, DiscoveryOptions opts = DiscoveryOptions(),
              Clock clock = Clock());

    // nullopt means "not currently reachable"; never throws for network errors.
    std::optional<BridgeCacheEntry> discover();
    // Forgets the cached credential, e.g. after the server rejected its token.
    void invalidate();

    const DiscoveryOptions& options() const { return opts_; }

private:
    std::optional<BridgeCacheEntry> load_fresh_cache();

    AgentTransport& transport_;
    CacheStore& cache_;
    DiscoveryOptions opts_;
    Clock clock_;
};
