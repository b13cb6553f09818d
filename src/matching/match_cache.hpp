#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/models.hpp"

namespace killwatch {

// Short-lived memo of killmail fingerprint to matched profile ids.
// Not synchronized; MatchCoordinator guards it with its own mutex.
class MatchCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit MatchCache(std::chrono::milliseconds ttl);

    // Hex MD5 over the fields the selector and the common rules look at,
    // including attacker character ids.
    static std::string fingerprint(const Killmail &killmail);

    bool enabled() const { return m_ttl.count() > 0; }

    // Entries stored under another generation, or past their TTL, miss.
    std::optional<std::vector<std::string>> lookup(const std::string &fingerprint,
                                                   uint64_t generation,
                                                   Clock::time_point now);
    void store(const std::string &fingerprint,
               std::vector<std::string> matches,
               uint64_t generation,
               Clock::time_point now);

    // Returns the number of entries removed.
    std::size_t purgeExpired(Clock::time_point now);
    void clear();

    std::size_t size() const { return m_entries.size(); }
    uint64_t hits() const { return m_hits; }
    uint64_t misses() const { return m_misses; }

private:
    struct Entry {
        std::vector<std::string> matches;
        uint64_t generation = 0;
        Clock::time_point expiresAt;
    };

    std::chrono::milliseconds m_ttl;
    std::unordered_map<std::string, Entry> m_entries;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
};

} // namespace killwatch
