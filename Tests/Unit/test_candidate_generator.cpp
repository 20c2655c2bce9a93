#include <QtTest/QtTest>

#include "core/embedding/user_embedding_computer.h"
#include "core/feedback/interaction_recorder.h"
#include "core/learning/collaborative_scorer.h"
#include "core/ranking/candidate_generator.h"
#include "core/store/sqlite_store.h"
#include "recommendation_fixtures.h"

class TestCandidateGenerator : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testMergeUnionsSourcesAndKeepsMaxScores();
    void testMergeDropsSeenAndCaps();
    void testContentCandidatesFromUserEmbedding();
    void testContentSkippedWithoutUserEmbedding();
    void testSlowGraphTimesOut();
    void testGraphNeighborsExcludeSeen();
    void testManySeenNeighborsStillFillLimit();
    void testCollaborativeGatedByInteractionCount();
    void testCollaborativeSkippedWithoutModel();
    void testCollaborativeSignalNeedsTrainedUser();

private:
    static constexpr int kDims = 6;

    hr::CandidateGenerator makeGenerator(std::shared_ptr<const hr::GraphNeighborService> graph,
                                         const hr::Settings& settings = {});
    static hr::Candidate candidate(const QString& id, hr::CandidateSource source, double score);
    static hr::CandidateRequest requestFor(const QString& userId,
                                           std::set<hr::CandidateSource> sources);

    std::optional<hr::SQLiteStore> m_store;
    std::unique_ptr<hr::InteractionRecorder> m_recorder;
    std::unique_ptr<hr::UserEmbeddingComputer> m_embeddings;
    std::shared_ptr<hr::JsonResourceCatalog> m_catalog;
    std::shared_ptr<hr::CollaborativeScorer> m_scorer;
};

void TestCandidateGenerator::init()
{
    m_store = hr::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
    m_catalog = hr::test::makeCatalog(hr::test::clusteredCatalogJson(3, 4, kDims));
    m_recorder = std::make_unique<hr::InteractionRecorder>(m_store->rawDb());
    m_embeddings = std::make_unique<hr::UserEmbeddingComputer>(m_recorder.get(), m_catalog.get(),
                                                               nullptr, kDims, 100);
    m_scorer = std::make_shared<hr::CollaborativeScorer>();
}

void TestCandidateGenerator::cleanup()
{
    m_scorer.reset();
    m_embeddings.reset();
    m_recorder.reset();
    m_catalog.reset();
    m_store.reset();
}

hr::CandidateGenerator TestCandidateGenerator::makeGenerator(
    std::shared_ptr<const hr::GraphNeighborService> graph,
    const hr::Settings& settings)
{
    return hr::CandidateGenerator(m_catalog,
                                  std::make_shared<hr::test::BruteForceSimilarityIndex>(*m_catalog, kDims),
                                  std::move(graph),
                                  m_scorer,
                                  m_recorder.get(),
                                  m_embeddings.get(),
                                  settings);
}

hr::Candidate TestCandidateGenerator::candidate(const QString& id, hr::CandidateSource source, double score)
{
    hr::Candidate c;
    c.resourceId = id;
    c.sources.insert(source);
    switch (source) {
    case hr::CandidateSource::Collaborative: c.scores.collaborative = score; break;
    case hr::CandidateSource::Content:       c.scores.content = score; break;
    case hr::CandidateSource::Graph:         c.scores.graph = score; break;
    }
    return c;
}

hr::CandidateRequest TestCandidateGenerator::requestFor(const QString& userId,
                                                        std::set<hr::CandidateSource> sources)
{
    hr::CandidateRequest request;
    request.userId = userId;
    request.enabledSources = std::move(sources);
    return request;
}

void TestCandidateGenerator::testMergeUnionsSourcesAndKeepsMaxScores()
{
    const std::vector<std::vector<hr::Candidate>> sources = {
        {candidate(QStringLiteral("x"), hr::CandidateSource::Content, 0.5),
         candidate(QStringLiteral("y"), hr::CandidateSource::Content, 0.9)},
        {candidate(QStringLiteral("x"), hr::CandidateSource::Graph, 0.8)},
    };

    const auto merged = hr::CandidateGenerator::mergeSources(sources, {}, 10);
    QCOMPARE(merged.size(), size_t(2));
    QCOMPARE(merged[0].resourceId, QStringLiteral("y"));
    QCOMPARE(merged[1].resourceId, QStringLiteral("x"));
    QCOMPARE(merged[1].scores.content, 0.5);
    QCOMPARE(merged[1].scores.graph, 0.8);
    QVERIFY(merged[1].hasSource(hr::CandidateSource::Content));
    QVERIFY(merged[1].hasSource(hr::CandidateSource::Graph));
}

void TestCandidateGenerator::testMergeDropsSeenAndCaps()
{
    const std::vector<std::vector<hr::Candidate>> sources = {
        {candidate(QStringLiteral("seen"), hr::CandidateSource::Graph, 1.0),
         candidate(QStringLiteral("b"), hr::CandidateSource::Graph, 0.6),
         candidate(QStringLiteral("a"), hr::CandidateSource::Content, 0.6),
         candidate(QStringLiteral("c"), hr::CandidateSource::Content, 0.2)},
    };

    const auto merged = hr::CandidateGenerator::mergeSources(sources, {QStringLiteral("seen")}, 2);
    QCOMPARE(merged.size(), size_t(2));
    QCOMPARE(merged[0].resourceId, QStringLiteral("a"));
    QCOMPARE(merged[1].resourceId, QStringLiteral("b"));
}

void TestCandidateGenerator::testContentCandidatesFromUserEmbedding()
{
    QVERIFY(m_recorder->trackInteraction(QStringLiteral("u1"), QStringLiteral("c0-0"),
                                         QStringLiteral("annotation")));

    const hr::CandidateGenerator generator = makeGenerator(nullptr);
    const hr::CandidatePool pool = generator.generateCandidates(
        requestFor(QStringLiteral("u1"), {hr::CandidateSource::Content}));

    QCOMPARE(pool.interactionCount, 1);
    QVERIFY(pool.timedOutSources.isEmpty());
    QCOMPARE(pool.candidates.size(), size_t(3));
    for (const hr::Candidate& c : pool.candidates) {
        QVERIFY(c.resourceId.startsWith(QStringLiteral("c0-")));
        QVERIFY(c.resourceId != QStringLiteral("c0-0"));
        QVERIFY(c.hasSource(hr::CandidateSource::Content));
        QVERIFY(c.scores.content > 0.3);
        QCOMPARE(c.scores.graph, 0.0);
    }
}

void TestCandidateGenerator::testContentSkippedWithoutUserEmbedding()
{
    const hr::CandidateGenerator generator = makeGenerator(nullptr);
    const hr::CandidatePool pool = generator.generateCandidates(
        requestFor(QStringLiteral("newcomer"), {hr::CandidateSource::Content}));
    QCOMPARE(pool.interactionCount, 0);
    QVERIFY(pool.candidates.empty());
    QVERIFY(pool.timedOutSources.isEmpty());
}

void TestCandidateGenerator::testSlowGraphTimesOut()
{
    QVERIFY(m_recorder->trackInteraction(QStringLiteral("u1"), QStringLiteral("c0-0"),
                                         QStringLiteral("annotation")));

    hr::Settings settings;
    settings.sourceTimeoutMs = 50;
    auto graph = std::make_shared<hr::test::SlowGraph>(
        std::vector<hr::GraphNeighbor>{{QStringLiteral("c2-0"), 0.9, 1}}, 400);

    const hr::CandidateGenerator generator = makeGenerator(graph, settings);
    QElapsedTimer timer;
    timer.start();
    const hr::CandidatePool pool = generator.generateCandidates(
        requestFor(QStringLiteral("u1"), {hr::CandidateSource::Content, hr::CandidateSource::Graph}));

    QVERIFY(timer.elapsed() < 350);
    QCOMPARE(pool.timedOutSources, QStringList{QStringLiteral("graph")});
    QVERIFY(!pool.candidates.empty());
    for (const hr::Candidate& c : pool.candidates) {
        QVERIFY(!c.hasSource(hr::CandidateSource::Graph));
    }
}

void TestCandidateGenerator::testGraphNeighborsExcludeSeen()
{
    QVERIFY(m_recorder->trackInteraction(QStringLiteral("u1"), QStringLiteral("c0-0"),
                                         QStringLiteral("view")));

    auto graph = std::make_shared<hr::test::SlowGraph>(
        std::vector<hr::GraphNeighbor>{{QStringLiteral("c0-0"), 1.0, 1},
                                       {QStringLiteral("c1-2"), 0.7, 1},
                                       {QStringLiteral("c2-3"), 0.4, 2}},
        0);

    const hr::CandidateGenerator generator = makeGenerator(graph);
    const hr::CandidatePool pool = generator.generateCandidates(
        requestFor(QStringLiteral("u1"), {hr::CandidateSource::Graph}));

    QCOMPARE(pool.candidates.size(), size_t(2));
    QCOMPARE(pool.candidates[0].resourceId, QStringLiteral("c1-2"));
    QCOMPARE(pool.candidates[0].scores.graph, 0.7);
    QCOMPARE(pool.candidates[1].resourceId, QStringLiteral("c2-3"));
}

void TestCandidateGenerator::testManySeenNeighborsStillFillLimit()
{
    hr::Settings settings;
    settings.perSourceLimit = 2;

    // Four seen resources outrank every unseen neighbour.
    std::vector<hr::GraphNeighbor> neighbors;
    for (int n = 0; n < 4; ++n) {
        const QString id = QStringLiteral("c0-%1").arg(n);
        QVERIFY(m_recorder->trackInteraction(QStringLiteral("u1"), id, QStringLiteral("view")));
        neighbors.push_back({id, 1.0 - 0.01 * n, 1});
    }
    neighbors.push_back({QStringLiteral("c1-0"), 0.6, 1});
    neighbors.push_back({QStringLiteral("c1-1"), 0.5, 1});
    neighbors.push_back({QStringLiteral("c1-2"), 0.4, 2});

    const hr::CandidateGenerator generator =
        makeGenerator(std::make_shared<hr::test::SlowGraph>(neighbors, 0), settings);
    const hr::CandidatePool pool = generator.generateCandidates(
        requestFor(QStringLiteral("u1"), {hr::CandidateSource::Graph}));

    QCOMPARE(pool.candidates.size(), size_t(2));
    QCOMPARE(pool.candidates[0].resourceId, QStringLiteral("c1-0"));
    QCOMPARE(pool.candidates[1].resourceId, QStringLiteral("c1-1"));
}

void TestCandidateGenerator::testCollaborativeGatedByInteractionCount()
{
    m_scorer->setModel(std::shared_ptr<const hr::CollaborativeModel>(
        hr::CollaborativeModel::create({QStringLiteral("u1")},
                                       {QStringLiteral("c0-1"), QStringLiteral("c1-1"), QStringLiteral("c2-0")},
                                       4, {8}, 3)));

    QVERIFY(m_recorder->trackInteraction(QStringLiteral("u1"), QStringLiteral("c2-0"),
                                         QStringLiteral("annotation")));
    const hr::CandidateGenerator generator = makeGenerator(nullptr);
    const auto request = requestFor(QStringLiteral("u1"), {hr::CandidateSource::Collaborative});
    QVERIFY(generator.generateCandidates(request).candidates.empty());

    for (int n = 0; n < 4; ++n) {
        QVERIFY(m_recorder->trackInteraction(QStringLiteral("u1"), QStringLiteral("c2-%1").arg(n),
                                             QStringLiteral("view")));
    }
    const hr::CandidatePool pool = generator.generateCandidates(request);
    QCOMPARE(pool.interactionCount, 5);
    QCOMPARE(pool.candidates.size(), size_t(2));
    for (const hr::Candidate& c : pool.candidates) {
        QVERIFY(c.resourceId == QStringLiteral("c0-1") || c.resourceId == QStringLiteral("c1-1"));
        QVERIFY(c.hasSource(hr::CandidateSource::Collaborative));
        QVERIFY(c.scores.collaborative > 0.0 && c.scores.collaborative < 1.0);
    }
}

void TestCandidateGenerator::testCollaborativeSkippedWithoutModel()
{
    for (int n = 0; n < 6; ++n) {
        QVERIFY(m_recorder->trackInteraction(QStringLiteral("u1"), QStringLiteral("c1-%1").arg(n % 4),
                                             QStringLiteral("view")));
    }
    const hr::CandidateGenerator generator = makeGenerator(nullptr);
    const hr::CandidatePool pool = generator.generateCandidates(
        requestFor(QStringLiteral("u1"), {hr::CandidateSource::Collaborative}));
    QCOMPARE(pool.interactionCount, 6);
    QVERIFY(pool.candidates.empty());
    QVERIFY(pool.timedOutSources.isEmpty());
}

void TestCandidateGenerator::testCollaborativeSignalNeedsTrainedUser()
{
    const hr::CandidateGenerator generator = makeGenerator(nullptr);
    QVERIFY(!generator.hasCollaborativeSignal(QStringLiteral("u1")));

    m_scorer->setModel(std::shared_ptr<const hr::CollaborativeModel>(
        hr::CollaborativeModel::create({QStringLiteral("u1")}, {QStringLiteral("c0-1")}, 4, {8}, 3)));
    QVERIFY(generator.hasCollaborativeSignal(QStringLiteral("u1")));
    QVERIFY(!generator.hasCollaborativeSignal(QStringLiteral("stranger")));
}

QTEST_MAIN(TestCandidateGenerator)
#include "test_candidate_generator.moc"
