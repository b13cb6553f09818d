#include <QtTest/QtTest>

#include <limits>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testKillmailFromFeed();
    void testKillmailFallbacks();
    void testOutOfRangeNumbers();
    void testNoteworthyModulesFallback();
    void testKillmailRoundTrip();
    void testProfileRoundTrip();
    void testMatchRecordRoundTrip();
    void testEngineStatsShape();
    void testOperatorStrings();
    void testMissingFieldsDefaults();

private:
    static qint64 toSeconds(std::chrono::system_clock::time_point t)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
            t.time_since_epoch()).count();
    }
};

void ModelsJsonTests::testKillmailFromFeed()
{
    const auto j = nlohmann::json::parse(R"({
        "killmail_id": 123456789,
        "killmail_time": "2024-03-01T12:30:00Z",
        "solar_system_id": 30000142,
        "solar_system_name": "Jita",
        "victim": {
            "character_id": 90000001,
            "corporation_id": 98000001,
            "ship_type_id": 670,
            "character_name": "Pilot One",
            "ship_name": "Capsule"
        },
        "attackers": [
            {"character_id": 91000001, "final_blow": false},
            {"character_id": 91000002, "final_blow": true}
        ],
        "total_value": 2000000000.5,
        "module_tags": ["cyno", "covert", 7]
    })");

    const auto killmail = j.get<killwatch::Killmail>();
    QCOMPARE(killmail.killmailId, static_cast<int64_t>(123456789));
    QCOMPARE(killmail.solarSystemId, static_cast<int64_t>(30000142));
    QCOMPARE(QString::fromStdString(killmail.solarSystemName), QStringLiteral("Jita"));
    QCOMPARE(killmail.victim.shipTypeId, static_cast<int64_t>(670));
    QCOMPARE(killmail.victim.allianceId, static_cast<int64_t>(0));
    QCOMPARE(killmail.attackers.size(), static_cast<size_t>(2));
    QVERIFY(killmail.attackers[1].finalBlow);
    QCOMPARE(killmail.totalValue, 2000000000.5);
    QVERIFY(!killmail.attackerCount.has_value());
    QCOMPARE(killmail.moduleTags.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(killwatch::toIso8601Utc(killmail.killmailTime)),
             QStringLiteral("2024-03-01T12:30:00Z"));
}

void ModelsJsonTests::testKillmailFallbacks()
{
    const auto j = nlohmann::json::parse(R"({
        "killmail_id": 5,
        "kill_time": "2024-01-01T00:00:00Z",
        "system_id": 30002187,
        "attacker_count": 12,
        "zkb": {"totalValue": 150000000.0, "destroyedValue": 90000000.0, "fittedValue": 60000000.0}
    })");

    const auto killmail = j.get<killwatch::Killmail>();
    QCOMPARE(killmail.solarSystemId, static_cast<int64_t>(30002187));
    QCOMPARE(killmail.totalValue, 150000000.0);
    QCOMPARE(killmail.shipValue, 90000000.0);
    QCOMPARE(killmail.fittedValue, 60000000.0);
    QVERIFY(killmail.attackerCount.has_value());
    QCOMPARE(*killmail.attackerCount, 12);
    QVERIFY(killmail.killmailTime != std::chrono::system_clock::time_point{});
}

void ModelsJsonTests::testOutOfRangeNumbers()
{
    const auto j = nlohmann::json::parse(R"({
        "killmail_id": 1e30,
        "solar_system_id": -1e300,
        "victim": {"ship_type_id": 18446744073709551615, "character_id": 9.5e18},
        "attacker_count": 99999999999
    })");

    const auto killmail = j.get<killwatch::Killmail>();
    QCOMPARE(killmail.killmailId, static_cast<int64_t>(0));
    QCOMPARE(killmail.solarSystemId, static_cast<int64_t>(0));
    QCOMPARE(killmail.victim.shipTypeId, static_cast<int64_t>(0));
    QCOMPARE(killmail.victim.characterId, static_cast<int64_t>(0));
    QVERIFY(killmail.attackerCount.has_value());
    QCOMPARE(*killmail.attackerCount, std::numeric_limits<int>::max());

    const auto negative = nlohmann::json::parse(R"({"attacker_count": -3})").get<killwatch::Killmail>();
    QVERIFY(!negative.attackerCount.has_value());
}

void ModelsJsonTests::testNoteworthyModulesFallback()
{
    const auto legacy = nlohmann::json::parse(R"({"noteworthy_modules": ["cyno", 3, "bubble"]})");
    const auto killmail = legacy.get<killwatch::Killmail>();
    QCOMPARE(killmail.moduleTags.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(killmail.moduleTags.back()), QStringLiteral("bubble"));

    const auto both = nlohmann::json::parse(R"({"module_tags": ["covert"], "noteworthy_modules": ["cyno"]})");
    const auto preferred = both.get<killwatch::Killmail>();
    QCOMPARE(preferred.moduleTags.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(preferred.moduleTags.front()), QStringLiteral("covert"));
}

void ModelsJsonTests::testKillmailRoundTrip()
{
    killwatch::Killmail killmail;
    killmail.killmailId = 42;
    killmail.killmailTime = std::chrono::system_clock::now();
    killmail.solarSystemId = 30000144;
    killmail.solarSystemName = "Perimeter";
    killmail.victim.characterName = "Victim";
    killmail.victim.shipTypeId = 671;
    killwatch::Attacker attacker;
    attacker.characterId = 7;
    attacker.finalBlow = true;
    killmail.attackers.push_back(attacker);
    killmail.totalValue = 1.5e9;
    killmail.attackerCount = 3;
    killmail.moduleTags = {"cyno"};

    nlohmann::json j = killmail;
    const auto parsed = j.get<killwatch::Killmail>();

    QCOMPARE(parsed.killmailId, killmail.killmailId);
    QCOMPARE(parsed.solarSystemId, killmail.solarSystemId);
    QCOMPARE(QString::fromStdString(parsed.victim.characterName), QStringLiteral("Victim"));
    QCOMPARE(parsed.attackers.size(), static_cast<size_t>(1));
    QVERIFY(parsed.attackers.front().finalBlow);
    QCOMPARE(parsed.totalValue, 1.5e9);
    QCOMPARE(parsed.attackerCount.value_or(0), 3);
    QCOMPARE(toSeconds(parsed.killmailTime), toSeconds(killmail.killmailTime));
}

void ModelsJsonTests::testProfileRoundTrip()
{
    killwatch::SurveillanceProfile profile;
    profile.id = "profile-1";
    profile.name = "Jita gankers";
    profile.description = "Expensive losses in Jita";
    profile.filterTree = nlohmann::json{
        {"condition", "and"},
        {"rules", nlohmann::json::array({
            {{"field", "system_id"}, {"operator", "in"}, {"value", {30000142}}}
        })}
    };
    profile.active = false;
    profile.matchCount = 17;
    profile.lastMatchAt = std::chrono::system_clock::now();

    nlohmann::json j = profile;
    QVERIFY(j["lastMatchAt"].is_string());
    const auto parsed = j.get<killwatch::SurveillanceProfile>();

    QCOMPARE(QString::fromStdString(parsed.id), QStringLiteral("profile-1"));
    QCOMPARE(QString::fromStdString(parsed.name), QStringLiteral("Jita gankers"));
    QVERIFY(!parsed.active);
    QCOMPARE(parsed.matchCount, static_cast<int64_t>(17));
    QVERIFY(parsed.filterTree == profile.filterTree);
    QCOMPARE(toSeconds(parsed.lastMatchAt), toSeconds(profile.lastMatchAt));
}

void ModelsJsonTests::testMatchRecordRoundTrip()
{
    killwatch::MatchRecord record;
    record.profileId = "profile-1";
    record.killmailId = 99;
    record.killmailTime = std::chrono::system_clock::now();
    record.victimCharacterName = "Victim";
    record.victimShipName = "Rifter";
    record.solarSystemName = "Rancer";
    record.totalValue = 12345.0;
    record.matchedAt = std::chrono::system_clock::now();

    nlohmann::json j = record;
    const auto parsed = j.get<killwatch::MatchRecord>();

    QCOMPARE(QString::fromStdString(parsed.profileId), QStringLiteral("profile-1"));
    QCOMPARE(parsed.killmailId, static_cast<int64_t>(99));
    QCOMPARE(QString::fromStdString(parsed.victimShipName), QStringLiteral("Rifter"));
    QCOMPARE(parsed.totalValue, 12345.0);
    QCOMPARE(toSeconds(parsed.matchedAt), toSeconds(record.matchedAt));
}

void ModelsJsonTests::testEngineStatsShape()
{
    killwatch::EngineStats stats;
    stats.generation = 3;
    stats.profilesLoaded = 10;
    stats.failedProfileIds = {"bad"};
    stats.indexes.ships = 4;
    stats.cacheHits = 2;
    stats.droppedBatches = 1;

    const nlohmann::json j = stats;
    QCOMPARE(j["generation"].get<int>(), 3);
    QCOMPARE(j["failedProfileIds"].size(), static_cast<size_t>(1));
    QCOMPARE(j["indexes"]["ships"].get<int>(), 4);
    QCOMPARE(j["cache"]["hits"].get<int>(), 2);
    QCOMPARE(j["recorder"]["droppedBatches"].get<int>(), 1);
    QVERIFY(j["lastReload"].is_null());
}

void ModelsJsonTests::testOperatorStrings()
{
    const std::vector<std::string> names = {
        "eq", "ne", "gt", "lt", "gte", "lte", "in", "not_in",
        "contains_any", "contains_all", "not_contains"
    };
    for (const auto &name : names) {
        const auto op = killwatch::parseOperatorString(name);
        QVERIFY(op.has_value());
        QCOMPARE(QString::fromStdString(killwatch::toOperatorString(*op)),
                 QString::fromStdString(name));
    }
    QVERIFY(!killwatch::parseOperatorString("between").has_value());
    QVERIFY(!killwatch::parseOperatorString("EQ").has_value());
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const auto killmail = nlohmann::json::object().get<killwatch::Killmail>();
    QCOMPARE(killmail.killmailId, static_cast<int64_t>(0));
    QVERIFY(killmail.attackers.empty());
    QVERIFY(killmail.moduleTags.empty());
    QCOMPARE(killmail.totalValue, 0.0);

    const auto profile = nlohmann::json{{"id", "p"}}.get<killwatch::SurveillanceProfile>();
    QVERIFY(profile.active);
    QVERIFY(profile.filterTree.is_object());
    QCOMPARE(profile.matchCount, static_cast<int64_t>(0));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
