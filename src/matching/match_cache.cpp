#include "matching/match_cache.hpp"

#include <QByteArray>
#include <QCryptographicHash>

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>

#include "matching/field_extractor.hpp"

namespace killwatch {

MatchCache::MatchCache(std::chrono::milliseconds ttl)
    : m_ttl(ttl)
{
}

std::string MatchCache::fingerprint(const Killmail &killmail)
{
    std::vector<std::string> tags = killmail.moduleTags;
    std::sort(tags.begin(), tags.end());

    nlohmann::json attackers = nlohmann::json::array();
    for (const auto &attacker : killmail.attackers) {
        attackers.push_back(attacker.characterId);
    }

    const nlohmann::json key = nlohmann::json::array({
        killmail.killmailId,
        killmail.solarSystemId,
        killmail.victim.shipTypeId,
        killmail.totalValue,
        FieldExtractor::attackerCount(killmail),
        FieldExtractor::resolve(killmail, "final_blow_character_id"),
        tags,
        attackers
    });

    const QByteArray digest = QCryptographicHash::hash(QByteArray::fromStdString(key.dump()),
                                                       QCryptographicHash::Md5);
    return digest.toHex().toStdString();
}

std::optional<std::vector<std::string>> MatchCache::lookup(const std::string &fingerprint,
                                                           uint64_t generation,
                                                           Clock::time_point now)
{
    if (!enabled()) {
        return std::nullopt;
    }

    auto it = m_entries.find(fingerprint);
    if (it == m_entries.end()) {
        ++m_misses;
        return std::nullopt;
    }
    if (it->second.expiresAt <= now || it->second.generation != generation) {
        m_entries.erase(it);
        ++m_misses;
        return std::nullopt;
    }
    ++m_hits;
    return it->second.matches;
}

void MatchCache::store(const std::string &fingerprint,
                       std::vector<std::string> matches,
                       uint64_t generation,
                       Clock::time_point now)
{
    if (!enabled()) {
        return;
    }
    Entry &entry = m_entries[fingerprint];
    entry.matches = std::move(matches);
    entry.generation = generation;
    entry.expiresAt = now + m_ttl;
}

std::size_t MatchCache::purgeExpired(Clock::time_point now)
{
    std::size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.expiresAt <= now) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void MatchCache::clear()
{
    m_entries.clear();
}

} // namespace killwatch
