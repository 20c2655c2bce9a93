#include <QtTest/QtTest>

#include "core/catalog/in_memory_resource_graph.h"
#include "core/catalog/json_resource_catalog.h"
#include "recommendation_fixtures.h"

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <cmath>

class TestResourceCatalog : public QObject {
    Q_OBJECT

private slots:
    void testParsesAndNormalizesFields();
    void testSkipsEntriesWithoutId();
    void testNonNumericEmbeddingBecomesInvalid();
    void testLoadFromFile();
    void testLoadFromMissingOrMalformedFile();
    void testGraphNeighborsWithinHops();
    void testGraphIgnoresInvalidEdges();
    void testGraphLoadFromJson();
};

void TestResourceCatalog::testParsesAndNormalizesFields()
{
    QJsonObject obj = hr::test::resourceJson(QStringLiteral(" r1 "), QStringLiteral(" ArXiv "),
                                             {0.1, 0.2}, 42, 1.7, -0.2,
                                             {QStringLiteral("Ada"), QStringLiteral(" "), QStringLiteral("Grace ")});
    obj[QStringLiteral("isQualityOutlier")] = true;

    hr::JsonResourceCatalog catalog;
    catalog.loadFromJson(QJsonArray{obj});
    QCOMPARE(catalog.size(), 1);

    const auto meta = catalog.metadata(QStringLiteral("r1"));
    QVERIFY(meta.has_value());
    QCOMPARE(meta->source, QStringLiteral("arxiv"));
    QCOMPARE(meta->authors, (QStringList{QStringLiteral("Ada"), QStringLiteral("Grace")}));
    QCOMPARE(meta->qualityScore, 1.0);
    QCOMPARE(meta->recencyScore, 0.0);
    QCOMPARE(meta->viewCount, int64_t(42));
    QVERIFY(meta->isQualityOutlier);
    QCOMPARE(meta->embedding.size(), size_t(2));
    QVERIFY(!catalog.metadata(QStringLiteral("missing")).has_value());
}

void TestResourceCatalog::testSkipsEntriesWithoutId()
{
    QJsonObject noId = hr::test::resourceJson(QString(), QStringLiteral("s"), {1.0});
    hr::JsonResourceCatalog catalog;
    catalog.loadFromJson(QJsonArray{noId, QStringLiteral("not an object"),
                                    hr::test::resourceJson(QStringLiteral("b"), QStringLiteral("s"), {1.0}),
                                    hr::test::resourceJson(QStringLiteral("a"), QStringLiteral("s"), {1.0})});
    QCOMPARE(catalog.allResourceIds(), (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
}

void TestResourceCatalog::testNonNumericEmbeddingBecomesInvalid()
{
    QJsonObject obj = hr::test::resourceJson(QStringLiteral("r1"), QStringLiteral("s"), {});
    obj[QStringLiteral("embedding")] = QJsonArray{0.5, QStringLiteral("oops")};

    hr::JsonResourceCatalog catalog;
    catalog.loadFromJson(QJsonArray{obj});
    const auto meta = catalog.metadata(QStringLiteral("r1"));
    QVERIFY(meta.has_value());
    QVERIFY(std::isnan(meta->embedding.at(1)));

    hr::Error error;
    QVERIFY(!hr::EmbeddingVector::fromValues(meta->embedding, 2, &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::MalformedEmbedding);
}

void TestResourceCatalog::testLoadFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("catalog.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(QJsonDocument(hr::test::clusteredCatalogJson(2, 3, 4)).toJson());
    file.close();

    hr::JsonResourceCatalog catalog;
    QVERIFY(catalog.loadFromFile(path));
    QCOMPARE(catalog.size(), 6);
    QCOMPARE(catalog.metadata(QStringLiteral("c1-2"))->source, QStringLiteral("source-1"));
}

void TestResourceCatalog::testLoadFromMissingOrMalformedFile()
{
    hr::JsonResourceCatalog catalog;
    QVERIFY(!catalog.loadFromFile(QStringLiteral("/nonexistent/catalog.json")));

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("catalog.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{\"id\": \"not an array\"}");
    file.close();
    QVERIFY(!catalog.loadFromFile(path));
    QCOMPARE(catalog.size(), 0);
}

void TestResourceCatalog::testGraphNeighborsWithinHops()
{
    hr::InMemoryResourceGraph graph;
    graph.addEdge(QStringLiteral("a"), QStringLiteral("b"), 0.8);
    graph.addEdge(QStringLiteral("b"), QStringLiteral("c"), 0.5);
    graph.addEdge(QStringLiteral("a"), QStringLiteral("d"), 0.4);
    QCOMPARE(graph.edgeCount(), 3);

    const auto twoHops = graph.neighbors({QStringLiteral("a")}, 2, 10);
    QCOMPARE(twoHops.size(), size_t(3));
    QCOMPARE(twoHops[0].resourceId, QStringLiteral("b"));
    QCOMPARE(twoHops[0].hops, 1);
    QVERIFY(qFuzzyCompare(twoHops[0].score, 0.8));
    QCOMPARE(twoHops[1].resourceId, QStringLiteral("d"));
    QCOMPARE(twoHops[2].resourceId, QStringLiteral("c"));
    QCOMPARE(twoHops[2].hops, 2);
    // 0.8 * 0.5 with one hop of decay
    QVERIFY(qFuzzyCompare(twoHops[2].score, 0.8 * 0.5 * hr::InMemoryResourceGraph::kHopDecay));

    QCOMPARE(graph.neighbors({QStringLiteral("a")}, 1, 10).size(), size_t(2));
    QCOMPARE(graph.neighbors({QStringLiteral("a")}, 2, 1).size(), size_t(1));
    QVERIFY(graph.neighbors({QStringLiteral("a")}, 0, 10).empty());
    QVERIFY(graph.neighbors({}, 2, 10).empty());

    // Seeds are never returned.
    for (const hr::GraphNeighbor& n : graph.neighbors({QStringLiteral("a"), QStringLiteral("b")}, 2, 10)) {
        QVERIFY(n.resourceId != QStringLiteral("a"));
        QVERIFY(n.resourceId != QStringLiteral("b"));
    }
}

void TestResourceCatalog::testGraphIgnoresInvalidEdges()
{
    hr::InMemoryResourceGraph graph;
    graph.addEdge(QStringLiteral("a"), QStringLiteral("a"), 1.0);
    graph.addEdge(QStringLiteral("a"), QString(), 1.0);
    graph.addEdge(QStringLiteral("a"), QStringLiteral("b"), 0.0);
    graph.addEdge(QStringLiteral("a"), QStringLiteral("c"), std::nan(""));
    QCOMPARE(graph.edgeCount(), 0);

    graph.addEdge(QStringLiteral("a"), QStringLiteral("b"), 3.0);
    const auto out = graph.neighbors({QStringLiteral("a")}, 1, 10);
    QCOMPARE(out.size(), size_t(1));
    QCOMPARE(out[0].score, 1.0);
}

void TestResourceCatalog::testGraphLoadFromJson()
{
    QJsonObject edge;
    edge[QStringLiteral("source")] = QStringLiteral("x");
    edge[QStringLiteral("target")] = QStringLiteral("y");
    QJsonObject weighted;
    weighted[QStringLiteral("source")] = QStringLiteral("y");
    weighted[QStringLiteral("target")] = QStringLiteral("z");
    weighted[QStringLiteral("weight")] = 0.25;

    hr::InMemoryResourceGraph graph;
    graph.loadFromJson(QJsonArray{edge, weighted});
    QCOMPARE(graph.edgeCount(), 2);

    const auto out = graph.neighbors({QStringLiteral("y")}, 1, 10);
    QCOMPARE(out.size(), size_t(2));
    QCOMPARE(out[0].resourceId, QStringLiteral("x"));
    QCOMPARE(out[0].score, 1.0);
    QCOMPARE(out[1].score, 0.25);
}

QTEST_MAIN(TestResourceCatalog)
#include "test_resource_catalog.moc"
