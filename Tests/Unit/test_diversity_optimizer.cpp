#include <QtTest/QtTest>

#include "core/feedback/recommendation_metrics.h"
#include "core/ranking/diversity_optimizer.h"
#include "recommendation_fixtures.h"

#include <cmath>
#include <limits>

class TestDiversityOptimizer : public QObject {
    Q_OBJECT

private slots:
    void testEmptyInputAndZeroLimit();
    void testLambdaOneKeepsRelevanceOrder();
    void testLowLambdaInterleavesClusters();
    void testHighLambdaKeepsScoresEven();
    void testMissingEmbeddingCountsAsDissimilar();
    void testEqualScoresBreakTiesById();
    void testDegenerateEmbeddingsCountAsDissimilar();

private:
    static std::vector<hr::Candidate> clusteredCandidates(int clusters, int perCluster);
    static constexpr int kDims = 6;
};

// Cluster 0 scores highest, cluster 2 lowest; within a cluster scores fall
// with n.
std::vector<hr::Candidate> TestDiversityOptimizer::clusteredCandidates(int clusters, int perCluster)
{
    const auto catalog = hr::test::makeCatalog(hr::test::clusteredCatalogJson(clusters, perCluster, kDims));
    const double clusterBase[] = {0.9, 0.7, 0.6};

    std::vector<hr::Candidate> out;
    for (int c = 0; c < clusters; ++c) {
        for (int n = 0; n < perCluster; ++n) {
            const auto meta = catalog->metadata(QStringLiteral("c%1-%2").arg(c).arg(n));
            hr::Candidate candidate;
            candidate.resourceId = meta->resourceId;
            candidate.source = meta->source;
            candidate.viewCount = meta->viewCount;
            candidate.hybridScore = clusterBase[c % 3] - 0.01 * n;
            candidate.embedding = hr::EmbeddingVector::fromValues(meta->embedding, kDims).value();
            out.push_back(std::move(candidate));
        }
    }
    std::sort(out.begin(), out.end(), [](const hr::Candidate& a, const hr::Candidate& b) {
        return a.hybridScore > b.hybridScore;
    });
    return out;
}

void TestDiversityOptimizer::testEmptyInputAndZeroLimit()
{
    QVERIFY(hr::DiversityOptimizer::select({}, 0.5, 10).empty());
    QVERIFY(hr::DiversityOptimizer::select(clusteredCandidates(3, 2), 0.5, 0).empty());
}

void TestDiversityOptimizer::testLambdaOneKeepsRelevanceOrder()
{
    const auto ranked = clusteredCandidates(3, 4);
    const auto selected = hr::DiversityOptimizer::select(ranked, 1.0, 5);
    QCOMPARE(selected.size(), size_t(5));
    for (size_t i = 0; i < selected.size(); ++i) {
        QCOMPARE(selected[i].resourceId, ranked[i].resourceId);
    }
}

void TestDiversityOptimizer::testLowLambdaInterleavesClusters()
{
    const auto selected = hr::DiversityOptimizer::select(clusteredCandidates(3, 8), 0.3, 6);
    QCOMPARE(selected.size(), size_t(6));
    QCOMPARE(selected[0].resourceId, QStringLiteral("c0-0"));
    QCOMPARE(selected[1].resourceId, QStringLiteral("c1-0"));
    QCOMPARE(selected[2].resourceId, QStringLiteral("c2-0"));

    QSet<QString> sources;
    for (const hr::Candidate& c : selected) {
        sources.insert(c.source);
    }
    QCOMPARE(sources.size(), 3);
}

void TestDiversityOptimizer::testHighLambdaKeepsScoresEven()
{
    const auto pool = clusteredCandidates(3, 8);
    QVERIFY(pool.size() >= 20);

    const auto selected = hr::DiversityOptimizer::select(pool, 0.8, 10);
    QCOMPARE(selected.size(), size_t(10));
    const double gini = hr::RecommendationMetrics::giniCoefficient(selected);
    QVERIFY2(gini < 0.3, qPrintable(QString::number(gini)));

    QSet<QString> ids;
    for (const hr::Candidate& c : selected) {
        ids.insert(c.resourceId);
    }
    QCOMPARE(ids.size(), 10);
}

void TestDiversityOptimizer::testMissingEmbeddingCountsAsDissimilar()
{
    hr::Candidate withEmbedding;
    withEmbedding.resourceId = QStringLiteral("a");
    withEmbedding.embedding = hr::EmbeddingVector::fromValues({1.0, 0.0}, 2).value();
    hr::Candidate without;
    without.resourceId = QStringLiteral("b");

    QCOMPARE(hr::DiversityOptimizer::similarity(withEmbedding, without), 0.0);
    QCOMPARE(hr::DiversityOptimizer::similarity(without, without), 0.0);
    QVERIFY(qFuzzyCompare(hr::DiversityOptimizer::similarity(withEmbedding, withEmbedding), 1.0));

    // A non-finite lambda falls back to pure relevance.
    withEmbedding.hybridScore = 0.4;
    without.hybridScore = 0.9;
    const auto selected = hr::DiversityOptimizer::select({withEmbedding, without},
                                                         std::numeric_limits<double>::quiet_NaN(), 2);
    QCOMPARE(selected.size(), size_t(2));
    QCOMPARE(selected[0].resourceId, QStringLiteral("b"));
}

void TestDiversityOptimizer::testEqualScoresBreakTiesById()
{
    std::vector<hr::Candidate> ranked(3);
    ranked[0].resourceId = QStringLiteral("z");
    ranked[1].resourceId = QStringLiteral("m");
    ranked[2].resourceId = QStringLiteral("a");
    for (hr::Candidate& c : ranked) {
        c.hybridScore = 0.5;
    }

    const auto selected = hr::DiversityOptimizer::select(ranked, 0.7, 3);
    QCOMPARE(selected[0].resourceId, QStringLiteral("a"));
    QCOMPARE(selected[1].resourceId, QStringLiteral("m"));
    QCOMPARE(selected[2].resourceId, QStringLiteral("z"));
}

void TestDiversityOptimizer::testDegenerateEmbeddingsCountAsDissimilar()
{
    auto make = [](const QString& id, double score, hr::EmbeddingVector embedding) {
        hr::Candidate c;
        c.resourceId = id;
        c.hybridScore = score;
        c.embedding = std::move(embedding);
        return c;
    };

    const auto lead = make(QStringLiteral("lead"), 0.9,
                           hr::EmbeddingVector::fromValues(hr::test::axisVector(kDims, 0), kDims).value());
    const auto twin = make(QStringLiteral("twin"), 0.8,
                           hr::EmbeddingVector::fromValues(hr::test::axisVector(kDims, 0), kDims).value());
    const auto zero = make(QStringLiteral("zero"), 0.5, hr::EmbeddingVector::zeros(kDims));
    const auto shortVec = make(QStringLiteral("short"), 0.4,
                               hr::EmbeddingVector::fromValues(hr::test::axisVector(4, 0), 4).value());

    std::vector<double> extremeValues(kDims, static_cast<double>(std::numeric_limits<float>::max()));
    const auto extreme = make(QStringLiteral("extreme"), 0.3,
                              hr::EmbeddingVector::fromValues(extremeValues, kDims).value());

    QCOMPARE(hr::DiversityOptimizer::similarity(zero, lead), 0.0);
    QCOMPARE(hr::DiversityOptimizer::similarity(zero, zero), 0.0);
    QCOMPARE(hr::DiversityOptimizer::similarity(shortVec, lead), 0.0);
    const double extremeSim = hr::DiversityOptimizer::similarity(extreme, extreme);
    QVERIFY(std::isfinite(extremeSim));
    QVERIFY(qAbs(extremeSim - 1.0) < 1e-6);

    // lambda 0 ranks purely by dissimilarity: the zero-norm and mismatched
    // vectors beat the exact twin of the first pick.
    const auto selected = hr::DiversityOptimizer::select({lead, twin, zero, shortVec, extreme}, 0.0, 5);
    QCOMPARE(selected.size(), size_t(5));
    QCOMPARE(selected[0].resourceId, QStringLiteral("lead"));
    QCOMPARE(selected[1].resourceId, QStringLiteral("zero"));
    QCOMPARE(selected[2].resourceId, QStringLiteral("short"));
    QCOMPARE(selected.back().resourceId, QStringLiteral("twin"));
    for (const hr::Candidate& c : selected) {
        QVERIFY(std::isfinite(c.hybridScore));
    }
}

QTEST_MAIN(TestDiversityOptimizer)
#include "test_diversity_optimizer.moc"
