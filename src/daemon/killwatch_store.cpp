#include "daemon/killwatch_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

#include "common/engine_config.hpp"
#include "common/logging.hpp"

namespace killwatch {

namespace {

constexpr const char *kCreateProfilesTable =
    "CREATE TABLE IF NOT EXISTS profiles ("
    "    id TEXT PRIMARY KEY,"
    "    name TEXT NOT NULL,"
    "    description TEXT,"
    "    filter_tree TEXT NOT NULL,"
    "    active INTEGER NOT NULL DEFAULT 1,"
    "    match_count INTEGER NOT NULL DEFAULT 0,"
    "    last_match_at INTEGER,"
    "    created_at INTEGER NOT NULL,"
    "    updated_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateProfileMatchesTable =
    "CREATE TABLE IF NOT EXISTS profile_matches ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    profile_id TEXT NOT NULL,"
    "    killmail_id INTEGER NOT NULL,"
    "    killmail_time INTEGER,"
    "    victim_character_name TEXT,"
    "    victim_ship_name TEXT,"
    "    solar_system_name TEXT,"
    "    total_value REAL NOT NULL DEFAULT 0,"
    "    matched_at INTEGER NOT NULL,"
    "    UNIQUE (profile_id, killmail_id)"
    ");";

constexpr const char *kCreateMatchedAtIndex =
    "CREATE INDEX IF NOT EXISTS profile_matches_matched_at "
    "ON profile_matches (matched_at);";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kProfileColumns =
    "SELECT id, name, description, filter_tree, active, match_count, last_match_at "
    "FROM profiles";

constexpr const char *kMatchColumns =
    "SELECT profile_id, killmail_id, killmail_time, victim_character_name, "
    "victim_ship_name, solar_system_name, total_value, matched_at "
    "FROM profile_matches";

class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void bindOptionalTime(sqlite3_stmt *stmt, int index, std::chrono::system_clock::time_point value)
{
    if (value == std::chrono::system_clock::time_point{}) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, toEpochSeconds(value));
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::chrono::system_clock::time_point columnOptionalTime(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::chrono::system_clock::time_point{};
    }
    return fromEpochSeconds(sqlite3_column_int64(stmt, index));
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json::object();
    }
}

std::string generateUuid()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    const uint64_t part1 = dist(gen);
    const uint64_t part2 = dist(gen);

    std::ostringstream out;
    out << std::hex;
    out << (part1 >> 32);
    out << "-";
    out << ((part1 >> 16) & 0xFFFF);
    out << "-";
    out << (part1 & 0xFFFF);
    out << "-";
    out << (part2 >> 48);
    out << "-";
    out << (part2 & 0xFFFFFFFFFFFFULL);
    return out.str();
}

SurveillanceProfile readProfile(sqlite3_stmt *stmt)
{
    SurveillanceProfile profile;
    profile.id = columnText(stmt, 0);
    profile.name = columnText(stmt, 1);
    profile.description = columnText(stmt, 2);
    profile.filterTree = columnJson(stmt, 3);
    profile.active = sqlite3_column_int(stmt, 4) != 0;
    profile.matchCount = sqlite3_column_int64(stmt, 5);
    profile.lastMatchAt = columnOptionalTime(stmt, 6);
    return profile;
}

MatchRecord readMatch(sqlite3_stmt *stmt)
{
    MatchRecord record;
    record.profileId = columnText(stmt, 0);
    record.killmailId = sqlite3_column_int64(stmt, 1);
    record.killmailTime = columnOptionalTime(stmt, 2);
    record.victimCharacterName = columnText(stmt, 3);
    record.victimShipName = columnText(stmt, 4);
    record.solarSystemName = columnText(stmt, 5);
    record.totalValue = sqlite3_column_double(stmt, 6);
    record.matchedAt = fromEpochSeconds(sqlite3_column_int64(stmt, 7));
    return record;
}

std::vector<SurveillanceProfile> queryProfiles(sqlite3 *db, const std::string &sql)
{
    Statement stmt(db, sql);
    std::vector<SurveillanceProfile> profiles;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        profiles.push_back(readProfile(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("failed to read profiles: ") + sqlite3_errmsg(db));
    }
    return profiles;
}

bool profileExists(sqlite3 *db, const std::string &id)
{
    Statement stmt(db, "SELECT 1 FROM profiles WHERE id = ? LIMIT 1;");
    bindText(stmt.get(), 1, id);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

} // namespace

struct KillwatchStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;
};

KillwatchStore::KillwatchStore()
    : KillwatchStore(defaultDatabasePath())
{
}

KillwatchStore::KillwatchStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    if (databasePath != ":memory:") {
        const std::filesystem::path parent = std::filesystem::path(databasePath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(databasePath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open killwatch database: " + message);
    }
    sqlite3_busy_timeout(impl->db, 5000);

    execOrThrow(impl->db, kCreateProfilesTable);
    execOrThrow(impl->db, kCreateProfileMatchesTable);
    execOrThrow(impl->db, kCreateMatchedAtIndex);
    execOrThrow(impl->db, kCreateMetaTable);

    KWLOG_INFO(QStringLiteral("KillwatchStore"),
               QStringLiteral("KillwatchStore"),
               QStringLiteral("database_opened"),
               QStringLiteral("store_init"),
               QStringLiteral("sqlite_open"),
               ::killwatch::logging::defaultWho(),
               QString(),
               nlohmann::json{{"path", databasePath}});
}

KillwatchStore::~KillwatchStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::vector<SurveillanceProfile> KillwatchStore::listProfiles() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return queryProfiles(impl->db, std::string(kProfileColumns) + " ORDER BY name ASC, id ASC;");
}

std::vector<SurveillanceProfile> KillwatchStore::listActiveProfiles()
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return queryProfiles(impl->db,
                         std::string(kProfileColumns)
                             + " WHERE active = 1 ORDER BY created_at ASC, id ASC;");
}

std::optional<SurveillanceProfile> KillwatchStore::getProfile(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, std::string(kProfileColumns) + " WHERE id = ? LIMIT 1;");
    bindText(stmt.get(), 1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readProfile(stmt.get());
}

std::string KillwatchStore::upsertProfile(const SurveillanceProfile &profile)
{
    const std::string id = profile.id.empty() ? generateUuid() : profile.id;
    const int64_t now = toEpochSeconds(std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO profiles (id, name, description, filter_tree, active, "
                   "match_count, created_at, updated_at) VALUES (?, ?, ?, ?, ?, 0, ?, ?) "
                   "ON CONFLICT(id) DO UPDATE SET name = excluded.name, "
                   "description = excluded.description, filter_tree = excluded.filter_tree, "
                   "active = excluded.active, updated_at = excluded.updated_at;");
    bindText(stmt.get(), 1, id);
    bindText(stmt.get(), 2, profile.name);
    bindOptionalText(stmt.get(), 3, profile.description);
    bindText(stmt.get(), 4, profile.filterTree.dump());
    sqlite3_bind_int(stmt.get(), 5, profile.active ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 6, now);
    sqlite3_bind_int64(stmt.get(), 7, now);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to upsert profile");
    }
    return id;
}

bool KillwatchStore::deleteProfile(const std::string &id)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db);

    Statement matches(impl->db, "DELETE FROM profile_matches WHERE profile_id = ?;");
    bindText(matches.get(), 1, id);
    if (sqlite3_step(matches.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to delete profile matches");
    }

    Statement stmt(impl->db, "DELETE FROM profiles WHERE id = ?;");
    bindText(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to delete profile");
    }
    const bool removed = sqlite3_changes(impl->db) > 0;

    tx.commit();
    return removed;
}

bool KillwatchStore::setProfileActive(const std::string &id, bool active)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "UPDATE profiles SET active = ?, updated_at = ? WHERE id = ?;");
    sqlite3_bind_int(stmt.get(), 1, active ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(std::chrono::system_clock::now()));
    bindText(stmt.get(), 3, id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to update profile state");
    }
    return sqlite3_changes(impl->db) > 0;
}

std::size_t KillwatchStore::addProfileMatches(const std::string &profileId,
                                              const std::vector<MatchRecord> &records)
{
    if (records.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(impl->mutex);
    if (!profileExists(impl->db, profileId)) {
        throw std::runtime_error("unknown profile " + profileId);
    }

    // Rows and the profile counter commit together or not at all.
    Transaction tx(impl->db);
    Statement stmt(impl->db,
                   "INSERT OR IGNORE INTO profile_matches (profile_id, killmail_id, "
                   "killmail_time, victim_character_name, victim_ship_name, "
                   "solar_system_name, total_value, matched_at) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");

    std::size_t inserted = 0;
    std::chrono::system_clock::time_point lastMatchAt{};
    for (const auto &record : records) {
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
        bindText(stmt.get(), 1, profileId);
        sqlite3_bind_int64(stmt.get(), 2, record.killmailId);
        bindOptionalTime(stmt.get(), 3, record.killmailTime);
        bindOptionalText(stmt.get(), 4, record.victimCharacterName);
        bindOptionalText(stmt.get(), 5, record.victimShipName);
        bindOptionalText(stmt.get(), 6, record.solarSystemName);
        sqlite3_bind_double(stmt.get(), 7, record.totalValue);
        sqlite3_bind_int64(stmt.get(), 8, toEpochSeconds(record.matchedAt));

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("failed to insert profile match: ")
                                     + sqlite3_errmsg(impl->db));
        }
        if (sqlite3_changes(impl->db) > 0) {
            ++inserted;
            lastMatchAt = std::max(lastMatchAt, record.matchedAt);
        }
    }

    if (inserted > 0) {
        Statement update(impl->db,
                         "UPDATE profiles SET match_count = match_count + ?, "
                         "last_match_at = MAX(COALESCE(last_match_at, 0), ?) WHERE id = ?;");
        sqlite3_bind_int64(update.get(), 1, static_cast<int64_t>(inserted));
        sqlite3_bind_int64(update.get(), 2, toEpochSeconds(lastMatchAt));
        bindText(update.get(), 3, profileId);
        if (sqlite3_step(update.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("failed to update profile match count: ")
                                     + sqlite3_errmsg(impl->db));
        }
    }

    tx.commit();
    return inserted;
}

std::vector<MatchRecord> KillwatchStore::getProfileMatches(const std::string &profileId,
                                                           std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, std::string(kMatchColumns)
                                 + " WHERE profile_id = ? ORDER BY matched_at DESC, id DESC"
                                   " LIMIT ?;");
    bindText(stmt.get(), 1, profileId);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<int64_t>(limit));

    std::vector<MatchRecord> records;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        records.push_back(readMatch(stmt.get()));
    }
    return records;
}

std::vector<MatchRecord> KillwatchStore::getRecentMatches(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, std::string(kMatchColumns)
                                 + " ORDER BY matched_at DESC, id DESC LIMIT ?;");
    sqlite3_bind_int64(stmt.get(), 1, static_cast<int64_t>(limit));

    std::vector<MatchRecord> records;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        records.push_back(readMatch(stmt.get()));
    }
    return records;
}

std::optional<std::string> KillwatchStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void KillwatchStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to set meta value");
    }
}

bool KillwatchStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace killwatch
