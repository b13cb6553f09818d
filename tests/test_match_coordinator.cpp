#include <QtTest/QtTest>

#include <chrono>

#include <QSignalSpy>
#include <QTemporaryDir>
#include <QThread>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "matching/match_coordinator.hpp"

namespace {

nlohmann::json rule(const std::string &field, const std::string &op, const nlohmann::json &value)
{
    return nlohmann::json{{"field", field}, {"operator", op}, {"value", value}};
}

nlohmann::json group(const std::string &condition, const std::vector<nlohmann::json> &rules)
{
    return nlohmann::json{{"condition", condition}, {"rules", rules}};
}

killwatch::SurveillanceProfile makeProfile(const std::string &id, const nlohmann::json &definition)
{
    killwatch::SurveillanceProfile profile;
    profile.id = id;
    profile.name = id;
    profile.filterTree = definition;
    return profile;
}

killwatch::Killmail makeKillmail(int64_t killmailId, int64_t systemId, int64_t shipTypeId,
                                 double value, std::vector<std::string> tags = {})
{
    killwatch::Killmail km;
    km.killmailId = killmailId;
    km.solarSystemId = systemId;
    km.solarSystemName = "System";
    km.victim.shipTypeId = shipTypeId;
    km.victim.characterName = "Victim";
    km.totalValue = value;
    km.moduleTags = std::move(tags);
    km.attackers.resize(3);
    km.attackers.front().characterId = 91000001;
    km.attackers.front().finalBlow = true;
    return km;
}

class FakeSource : public killwatch::ProfileSource {
public:
    std::vector<killwatch::SurveillanceProfile> listActiveProfiles() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failing) {
            throw std::runtime_error("database is locked");
        }
        ++m_calls;
        if (!m_alternate.empty() && m_calls % 2 == 0) {
            return m_alternate;
        }
        return m_profiles;
    }

    void setProfiles(std::vector<killwatch::SurveillanceProfile> profiles)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_profiles = std::move(profiles);
    }

    // Every other call returns this set instead.
    void setAlternate(std::vector<killwatch::SurveillanceProfile> profiles)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_alternate = std::move(profiles);
    }

    void setFailing(bool failing)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing = failing;
    }

private:
    std::mutex m_mutex;
    std::vector<killwatch::SurveillanceProfile> m_profiles;
    std::vector<killwatch::SurveillanceProfile> m_alternate;
    bool m_failing = false;
    int m_calls = 0;
};

class FakePersistence : public killwatch::MatchPersistence {
public:
    std::size_t addProfileMatches(const std::string &profileId,
                                  const std::vector<killwatch::MatchRecord> &records) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &stored = m_records[profileId];
        stored.insert(stored.end(), records.begin(), records.end());
        m_counts[profileId] += static_cast<int64_t>(records.size());
        return records.size();
    }

    std::size_t recordCount(const std::string &profileId)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records[profileId].size();
    }

    int64_t matchCount(const std::string &profileId)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_counts[profileId];
    }

private:
    std::mutex m_mutex;
    std::map<std::string, std::vector<killwatch::MatchRecord>> m_records;
    std::map<std::string, int64_t> m_counts;
};

killwatch::EngineConfig testConfig()
{
    killwatch::EngineConfig config;
    config.flushInterval = std::chrono::milliseconds(0);
    return config;
}

std::vector<killwatch::SurveillanceProfile> mixedProfiles()
{
    return {
        makeProfile("jita-expensive", group("and", {
            rule("system_id", "in", {30000142}), rule("total_value", "gt", 1.0e9)})),
        makeProfile("titans", group("and", {rule("victim_ship_type_id", "in", {11567})})),
        makeProfile("cyno-or-blops", group("or", {
            rule("module_tags", "contains_any", {"cyno"}),
            rule("victim_ship_type_id", "in", {22428, 22430})})),
        makeProfile("solo", group("and", {rule("kill_category", "eq", "solo")})),
        makeProfile("big-gangs", group("and", {
            rule("attacker_count", "gte", 3), rule("total_value", "gte", 1.0e8)}))
    };
}

std::vector<killwatch::Killmail> sampleEvents()
{
    std::vector<killwatch::Killmail> events;
    int64_t id = 1;
    for (int64_t system : {30000142, 30000144}) {
        for (int64_t ship : {670, 11567, 22428}) {
            for (double value : {5.0e7, 5.0e8, 2.0e9}) {
                events.push_back(makeKillmail(id++, system, ship, value));
                events.push_back(makeKillmail(id++, system, ship, value, {"cyno"}));
            }
        }
    }
    return events;
}

} // namespace

class MatchCoordinatorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testSystemAndValueProfile();
    void testCompileFailureIsolated();
    void testConcurrentReloadAndMatch();
    void testReloadKeepsResults();
    void testCacheDoesNotChangeResults();
    void testCacheHitsCounted();
    void testFailedReloadKeepsGeneration();
    void testMatchFoundSignal();
    void testFlushHandsMatchesToRecorder();
    void testPendingLimitTriggersFlush();
    void testMatchAllProfiles();
    void testTestFilter();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void MatchCoordinatorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void MatchCoordinatorTests::cleanupTestCase()
{
    qputenv("HOME", m_prevHome);
}

void MatchCoordinatorTests::testSystemAndValueProfile()
{
    FakeSource source;
    source.setProfiles({makeProfile("P1", group("and", {
        rule("system_id", "eq", 30000142), rule("total_value", "gt", 1000000000)}))});
    FakePersistence persistence;
    killwatch::MatchCoordinator coordinator(source, persistence, testConfig());
    QVERIFY(coordinator.reload());

    const std::vector<std::string> expected = {"P1"};
    QCOMPARE(coordinator.match(makeKillmail(1, 30000142, 670, 2.0e9)), expected);
    QVERIFY(coordinator.match(makeKillmail(2, 30000144, 670, 2.0e9)).empty());
    QVERIFY(coordinator.match(makeKillmail(3, 30000142, 670, 1.0e9)).empty());
}

void MatchCoordinatorTests::testCompileFailureIsolated()
{
    FakeSource source;
    auto profiles = mixedProfiles();
    profiles.push_back(makeProfile("broken", group("and", {rule("system_id", "near", 30000142)})));
    killwatch::SurveillanceProfile inactive = makeProfile("inactive", group("and", {
        rule("system_id", "in", {30000142})}));
    inactive.active = false;
    profiles.push_back(inactive);
    source.setProfiles(profiles);

    FakePersistence persistence;
    killwatch::MatchCoordinator coordinator(source, persistence, testConfig());
    QVERIFY(coordinator.reload());

    const auto stats = coordinator.stats();
    QCOMPARE(stats.profilesLoaded, static_cast<std::size_t>(6));
    QCOMPARE(stats.compiledProfiles, static_cast<std::size_t>(5));
    const std::vector<std::string> failed = {"broken"};
    QCOMPARE(stats.failedProfileIds, failed);
    QCOMPARE(stats.indexedProfiles + stats.unindexedProfiles, static_cast<std::size_t>(5));

    const std::vector<std::string> expected = {"big-gangs", "jita-expensive"};
    QCOMPARE(coordinator.match(makeKillmail(1, 30000142, 670, 2.0e9)), expected);
}

void MatchCoordinatorTests::testConcurrentReloadAndMatch()
{
    std::vector<killwatch::SurveillanceProfile> first;
    std::vector<killwatch::SurveillanceProfile> second;
    for (int i = 0; i < 30; ++i) {
        first.push_back(makeProfile("a" + std::to_string(i), group("and", {
            rule("total_value", "gt", 0)})));
        second.push_back(makeProfile("b" + std::to_string(i), group("or", {
            rule("attacker_count", "gte", 1), rule("system_id", "eq", 1)})));
    }

    FakeSource source;
    source.setProfiles(first);
    source.setAlternate(second);
    FakePersistence persistence;
    killwatch::EngineConfig config = testConfig();
    config.cacheTtl = std::chrono::milliseconds(5);
    killwatch::MatchCoordinator coordinator(source, persistence, config);
    QVERIFY(coordinator.reload());

    std::atomic<bool> running{true};
    std::atomic<int> mixed{0};
    std::atomic<int> wrongSize{0};
    std::atomic<int> completed{0};

    std::vector<std::unique_ptr<QThread>> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back(QThread::create([&, t]() {
            for (int n = 0; n < 200; ++n) {
                const auto result = coordinator.match(
                    makeKillmail(t * 1000 + n, 30000142, 670, 1.0e6 + (n % 7)));
                if (result.empty()) {
                    continue;
                }
                const char prefix = result.front().front();
                for (const auto &id : result) {
                    if (id.front() != prefix) {
                        ++mixed;
                    }
                }
                if (result.size() != 30) {
                    ++wrongSize;
                }
                ++completed;
            }
        }));
    }
    for (int t = 0; t < 2; ++t) {
        threads.emplace_back(QThread::create([&]() {
            do {
                coordinator.reload();
                QThread::usleep(200);
            } while (running.load());
        }));
    }

    for (auto &thread : threads) {
        thread->start();
    }
    for (int t = 0; t < 4; ++t) {
        QVERIFY(threads[t]->wait(60000));
    }
    running.store(false);
    for (auto &thread : threads) {
        QVERIFY(thread->wait(60000));
    }

    QCOMPARE(mixed.load(), 0);
    QCOMPARE(wrongSize.load(), 0);
    QVERIFY(completed.load() > 0);
    QVERIFY(coordinator.stats().generation > 1);
}

void MatchCoordinatorTests::testReloadKeepsResults()
{
    FakeSource source;
    source.setProfiles(mixedProfiles());
    FakePersistence persistence;
    killwatch::MatchCoordinator coordinator(source, persistence, testConfig());
    QVERIFY(coordinator.reload());

    const auto events = sampleEvents();
    std::vector<std::vector<std::string>> before;
    for (const auto &km : events) {
        before.push_back(coordinator.match(km));
    }

    QVERIFY(coordinator.reload());
    QCOMPARE(coordinator.stats().generation, static_cast<uint64_t>(2));

    for (std::size_t i = 0; i < events.size(); ++i) {
        QCOMPARE(coordinator.match(events[i]), before[i]);
    }
}

void MatchCoordinatorTests::testCacheDoesNotChangeResults()
{
    FakeSource source;
    source.setProfiles(mixedProfiles());
    FakePersistence persistence;

    killwatch::EngineConfig cached = testConfig();
    killwatch::EngineConfig uncached = testConfig();
    uncached.cacheTtl = std::chrono::milliseconds(0);

    killwatch::MatchCoordinator withCache(source, persistence, cached);
    killwatch::MatchCoordinator withoutCache(source, persistence, uncached);
    QVERIFY(withCache.reload());
    QVERIFY(withoutCache.reload());

    const auto events = sampleEvents();
    for (int pass = 0; pass < 2; ++pass) {
        for (const auto &km : events) {
            QCOMPARE(withCache.match(km), withoutCache.match(km));
        }
    }
    QVERIFY(withCache.stats().cacheHits > 0);
    QCOMPARE(withoutCache.stats().cacheHits, static_cast<uint64_t>(0));
}

void MatchCoordinatorTests::testCacheHitsCounted()
{
    FakeSource source;
    source.setProfiles(mixedProfiles());
    FakePersistence persistence;
    killwatch::MatchCoordinator coordinator(source, persistence, testConfig());
    QVERIFY(coordinator.reload());

    const auto km = makeKillmail(1, 30000142, 670, 2.0e9);
    const auto first = coordinator.match(km);
    const auto second = coordinator.match(km);
    QCOMPARE(second, first);

    const auto stats = coordinator.stats();
    QCOMPARE(stats.matchesProcessed, static_cast<uint64_t>(2));
    QCOMPARE(stats.cacheHits, static_cast<uint64_t>(1));
    QCOMPARE(stats.totalMatches, static_cast<uint64_t>(first.size()));
    QCOMPARE(stats.pendingMatches, first.size());

    // A reload starts a fresh cache.
    QVERIFY(coordinator.reload());
    QCOMPARE(coordinator.stats().cacheSize, static_cast<std::size_t>(0));
}

void MatchCoordinatorTests::testFailedReloadKeepsGeneration()
{
    FakeSource source;
    source.setProfiles(mixedProfiles());
    FakePersistence persistence;
    killwatch::MatchCoordinator coordinator(source, persistence, testConfig());
    QVERIFY(coordinator.stats().lastReload == std::chrono::system_clock::time_point{});

    const auto reloadStarted = std::chrono::system_clock::now();
    QVERIFY(coordinator.reload());
    const auto firstReload = coordinator.stats().lastReload;
    QVERIFY(firstReload >= reloadStarted);

    const auto km = makeKillmail(1, 30000142, 11567, 2.0e9);
    const auto before = coordinator.match(km);
    QVERIFY(!before.empty());

    source.setFailing(true);
    QVERIFY(!coordinator.reload());

    const auto stats = coordinator.stats();
    QCOMPARE(stats.generation, static_cast<uint64_t>(1));
    QCOMPARE(stats.failedReloads, static_cast<uint64_t>(1));
    QVERIFY(stats.lastReload == firstReload);
    QCOMPARE(coordinator.match(km), before);

    source.setFailing(false);
    QVERIFY(coordinator.reload());
    QCOMPARE(coordinator.stats().generation, static_cast<uint64_t>(2));
}

void MatchCoordinatorTests::testMatchFoundSignal()
{
    FakeSource source;
    source.setProfiles(mixedProfiles());
    FakePersistence persistence;
    killwatch::MatchCoordinator coordinator(source, persistence, testConfig());

    QSignalSpy generationSpy(&coordinator, &killwatch::MatchCoordinator::generationChanged);
    QVERIFY(coordinator.reload());
    QCOMPARE(generationSpy.count(), 1);
    QCOMPARE(generationSpy.takeFirst().at(0).toULongLong(), static_cast<qulonglong>(1));

    QSignalSpy matchSpy(&coordinator, &killwatch::MatchCoordinator::matchFound);
    const auto matched = coordinator.match(makeKillmail(42, 30000144, 11567, 5.0e10));
    QCOMPARE(matchSpy.count(), static_cast<int>(matched.size()));
    QVERIFY(!matched.empty());

    const QList<QVariant> arguments = matchSpy.takeFirst();
    QCOMPARE(arguments.at(0).toString(), QString::fromStdString(matched.front()));
    QCOMPARE(arguments.at(1).toLongLong(), static_cast<qlonglong>(42));
}

void MatchCoordinatorTests::testFlushHandsMatchesToRecorder()
{
    FakeSource source;
    source.setProfiles(mixedProfiles());
    FakePersistence persistence;
    killwatch::MatchCoordinator coordinator(source, persistence, testConfig());
    QVERIFY(coordinator.reload());

    QCOMPARE(coordinator.flushPendingMatches(), static_cast<std::size_t>(0));

    coordinator.match(makeKillmail(1, 30000144, 11567, 2.0e9));
    coordinator.match(makeKillmail(2, 30000144, 11567, 3.0e9));
    QCOMPARE(coordinator.stats().pendingMatches, static_cast<std::size_t>(4));

    // The recorder is not running, so the batch is written synchronously.
    QCOMPARE(coordinator.flushPendingMatches(), static_cast<std::size_t>(4));
    QCOMPARE(persistence.recordCount("titans"), static_cast<std::size_t>(2));
    QCOMPARE(persistence.matchCount("big-gangs"), static_cast<int64_t>(2));

    const auto stats = coordinator.stats();
    QCOMPARE(stats.pendingMatches, static_cast<std::size_t>(0));
    QCOMPARE(stats.recordedMatches, static_cast<uint64_t>(4));
    QVERIFY(stats.lastFlush != std::chrono::system_clock::time_point{});
}

void MatchCoordinatorTests::testPendingLimitTriggersFlush()
{
    FakeSource source;
    source.setProfiles(mixedProfiles());
    FakePersistence persistence;
    killwatch::EngineConfig config = testConfig();
    config.maxPendingMatches = 3;
    killwatch::MatchCoordinator coordinator(source, persistence, config);
    QVERIFY(coordinator.reload());

    coordinator.match(makeKillmail(1, 30000144, 11567, 2.0e9));
    QCOMPARE(persistence.recordCount("titans"), static_cast<std::size_t>(0));
    coordinator.match(makeKillmail(2, 30000144, 11567, 2.0e9));
    QCOMPARE(persistence.recordCount("titans"), static_cast<std::size_t>(2));
    QCOMPARE(coordinator.stats().pendingMatches, static_cast<std::size_t>(0));
}

void MatchCoordinatorTests::testMatchAllProfiles()
{
    FakeSource source;
    source.setProfiles(mixedProfiles());
    FakePersistence persistence;
    killwatch::MatchCoordinator coordinator(source, persistence, testConfig());
    QVERIFY(coordinator.reload());

    auto solo = makeKillmail(1, 30000142, 670, 2.0e9);
    solo.attackers.resize(1);
    // The system index fires, so the unindexed "solo" profile is not a candidate.
    const std::vector<std::string> indexed = {"jita-expensive"};
    QCOMPARE(coordinator.match(solo), indexed);

    const std::vector<std::string> everything = {"jita-expensive", "solo"};
    QCOMPARE(coordinator.matchAllProfiles(solo), everything);
    QCOMPARE(coordinator.stats().pendingMatches, static_cast<std::size_t>(1));
}

void MatchCoordinatorTests::testTestFilter()
{
    const auto km = makeKillmail(1, 30000142, 670, 2.0e9, {"cyno"});

    auto result = killwatch::MatchCoordinator::testFilter(
        group("and", {rule("module_tags", "contains_any", {"cyno"})}), km);
    QVERIFY(result.compiled);
    QVERIFY(result.matched);
    QVERIFY(result.error.empty());

    result = killwatch::MatchCoordinator::testFilter(
        group("and", {rule("total_value", "lt", 1.0e9)}), km);
    QVERIFY(result.compiled);
    QVERIFY(!result.matched);

    result = killwatch::MatchCoordinator::testFilter(nlohmann::json{{"rules", 5}}, km);
    QVERIFY(!result.compiled);
    QVERIFY(!result.matched);
    QVERIFY(!result.error.empty());
}

QTEST_MAIN(MatchCoordinatorTests)
#include "test_match_coordinator.moc"
