#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "matching/profile_source.hpp"

namespace killwatch {

// KillwatchStore is the SQLite access layer for surveillance profiles, their
// recorded matches, and meta values. Calls are serialized internally so the
// recorder thread and the API server can share one instance.
class KillwatchStore : public ProfileSource, public MatchPersistence {
public:
    // Opens (and creates) the database at defaultDatabasePath().
    KillwatchStore();
    explicit KillwatchStore(const std::string &databasePath);
    ~KillwatchStore() override;

    KillwatchStore(const KillwatchStore &) = delete;
    KillwatchStore &operator=(const KillwatchStore &) = delete;

    // Profile definitions. An upsert without an id gets a generated one, which is returned.
    std::vector<SurveillanceProfile> listProfiles() const;
    std::vector<SurveillanceProfile> listActiveProfiles() override;
    std::optional<SurveillanceProfile> getProfile(const std::string &id) const;
    std::string upsertProfile(const SurveillanceProfile &profile);
    bool deleteProfile(const std::string &id);
    bool setProfileActive(const std::string &id, bool active);

    // Match records. Inserts are idempotent per (profile, killmail) and bump
    // the profile's match_count in the same transaction.
    std::size_t addProfileMatches(const std::string &profileId,
                                  const std::vector<MatchRecord> &records) override;
    std::vector<MatchRecord> getProfileMatches(const std::string &profileId,
                                               std::size_t limit) const;
    std::vector<MatchRecord> getRecentMatches(std::size_t limit) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace killwatch
