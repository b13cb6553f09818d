#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <algorithm>
#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>

#include "matching/evaluator.hpp"

namespace {

using Clock = std::chrono::steady_clock;

killwatch::CompiledProfile makeProfile(const std::string &id, killwatch::Predicate predicate)
{
    killwatch::CompiledProfile profile;
    profile.id = id;
    profile.name = id;
    profile.predicate = std::move(predicate);
    return profile;
}

std::vector<std::size_t> allSlots(const killwatch::ProfileGeneration &generation)
{
    std::vector<std::size_t> slots;
    for (std::size_t i = 0; i < generation.profiles.size(); ++i) {
        slots.push_back(i);
    }
    return slots;
}

killwatch::Killmail sampleKillmail()
{
    killwatch::Killmail km;
    km.killmailId = 77;
    km.solarSystemId = 30000142;
    km.totalValue = 1.0e9;
    return km;
}

} // namespace

class EvaluatorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testSequentialMatches();
    void testParallelMatchesSameAsSequential();
    void testThrowingPredicateIsIsolated();
    void testSlowCandidateDiscarded();
    void testDeadlineReturnsEmpty();
    void testEmptyInput();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void EvaluatorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void EvaluatorTests::cleanupTestCase()
{
    qputenv("HOME", m_prevHome);
}

void EvaluatorTests::testSequentialMatches()
{
    auto generation = std::make_shared<killwatch::ProfileGeneration>();
    generation->profiles.push_back(makeProfile("b", [](const killwatch::Killmail &) { return true; }));
    generation->profiles.push_back(makeProfile("c", [](const killwatch::Killmail &) { return false; }));
    generation->profiles.push_back(makeProfile("a", [](const killwatch::Killmail &km) {
        return km.solarSystemId == 30000142;
    }));

    killwatch::Evaluator evaluator{killwatch::EngineConfig{}};
    const auto result = evaluator.evaluate(generation, allSlots(*generation), sampleKillmail(),
                                           Clock::now() + std::chrono::seconds(5));

    QVERIFY(!result.timedOut);
    QCOMPARE(result.evaluated, static_cast<std::size_t>(3));
    const std::vector<std::string> expected = {"a", "b"};
    QCOMPARE(result.matched, expected);
}

void EvaluatorTests::testParallelMatchesSameAsSequential()
{
    auto generation = std::make_shared<killwatch::ProfileGeneration>();
    std::atomic<int> calls{0};
    std::set<std::string> expected;
    for (int i = 0; i < 64; ++i) {
        const std::string id = "p" + std::to_string(100 + i);
        const bool hit = i % 3 == 0;
        if (hit) {
            expected.insert(id);
        }
        generation->profiles.push_back(makeProfile(id, [hit, &calls](const killwatch::Killmail &) {
            ++calls;
            return hit;
        }));
    }

    killwatch::EngineConfig config;
    config.sequentialThreshold = 10;
    config.maxWorkers = 4;
    killwatch::Evaluator evaluator(config);

    const auto result = evaluator.evaluate(generation, allSlots(*generation), sampleKillmail(),
                                           Clock::now() + std::chrono::seconds(5));

    QVERIFY(!result.timedOut);
    QCOMPARE(calls.load(), 64);
    QCOMPARE(result.evaluated, static_cast<std::size_t>(64));
    QCOMPARE(result.matched, std::vector<std::string>(expected.begin(), expected.end()));

    config.sequentialThreshold = 1000;
    killwatch::Evaluator sequential(config);
    const auto sequentialResult = sequential.evaluate(generation, allSlots(*generation),
                                                      sampleKillmail(),
                                                      Clock::now() + std::chrono::seconds(5));
    QCOMPARE(sequentialResult.matched, result.matched);
}

void EvaluatorTests::testThrowingPredicateIsIsolated()
{
    auto generation = std::make_shared<killwatch::ProfileGeneration>();
    for (int i = 0; i < 20; ++i) {
        const std::string id = "p" + std::to_string(10 + i);
        if (i == 7) {
            generation->profiles.push_back(makeProfile(id, [](const killwatch::Killmail &) -> bool {
                throw std::runtime_error("broken predicate");
            }));
        } else {
            generation->profiles.push_back(makeProfile(id, [](const killwatch::Killmail &) {
                return true;
            }));
        }
    }

    killwatch::Evaluator evaluator{killwatch::EngineConfig{}};
    const auto result = evaluator.evaluate(generation, allSlots(*generation), sampleKillmail(),
                                           Clock::now() + std::chrono::seconds(5));

    QVERIFY(!result.timedOut);
    QCOMPARE(result.failed, static_cast<std::size_t>(1));
    QCOMPARE(result.matched.size(), static_cast<std::size_t>(19));
    QVERIFY(std::find(result.matched.begin(), result.matched.end(), "p17") == result.matched.end());
}

void EvaluatorTests::testSlowCandidateDiscarded()
{
    auto generation = std::make_shared<killwatch::ProfileGeneration>();
    generation->profiles.push_back(makeProfile("fast", [](const killwatch::Killmail &) { return true; }));
    generation->profiles.push_back(makeProfile("slow", [](const killwatch::Killmail &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        return true;
    }));

    killwatch::EngineConfig config;
    config.candidateTimeout = std::chrono::milliseconds(20);
    killwatch::Evaluator evaluator(config);

    const auto result = evaluator.evaluate(generation, allSlots(*generation), sampleKillmail(),
                                           Clock::now() + std::chrono::seconds(5));

    QVERIFY(!result.timedOut);
    QCOMPARE(result.slow, static_cast<std::size_t>(1));
    const std::vector<std::string> expected = {"fast"};
    QCOMPARE(result.matched, expected);
}

void EvaluatorTests::testDeadlineReturnsEmpty()
{
    auto generation = std::make_shared<killwatch::ProfileGeneration>();
    for (int i = 0; i < 24; ++i) {
        generation->profiles.push_back(makeProfile("p" + std::to_string(10 + i),
                                                   [](const killwatch::Killmail &) {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            return true;
        }));
    }

    killwatch::EngineConfig config;
    config.maxWorkers = 2;
    killwatch::Evaluator parallel(config);
    const auto result = parallel.evaluate(generation, allSlots(*generation), sampleKillmail(),
                                          Clock::now() + std::chrono::milliseconds(50));
    QVERIFY(result.timedOut);
    QVERIFY(result.matched.empty());

    config.sequentialThreshold = 1000;
    killwatch::Evaluator sequential(config);
    const auto sequentialResult = sequential.evaluate(generation, allSlots(*generation),
                                                      sampleKillmail(),
                                                      Clock::now() + std::chrono::milliseconds(50));
    QVERIFY(sequentialResult.timedOut);
    QVERIFY(sequentialResult.matched.empty());
    QVERIFY(sequentialResult.evaluated < generation->profiles.size());
}

void EvaluatorTests::testEmptyInput()
{
    killwatch::Evaluator evaluator{killwatch::EngineConfig{}};
    auto generation = std::make_shared<killwatch::ProfileGeneration>();

    const auto noSlots = evaluator.evaluate(generation, {}, sampleKillmail(),
                                            Clock::now() + std::chrono::seconds(1));
    QVERIFY(!noSlots.timedOut);
    QCOMPARE(noSlots.evaluated, static_cast<std::size_t>(0));

    const auto noGeneration = evaluator.evaluate(nullptr, {0}, sampleKillmail(),
                                                 Clock::now() + std::chrono::seconds(1));
    QVERIFY(noGeneration.matched.empty());
}

QTEST_MAIN(EvaluatorTests)
#include "test_evaluator.moc"
