#include <QtTest/QtTest>

#include "core/learning/collaborative_model.h"
#include "core/shared/ipc_messages.h"
#include "ipc_test_utils.h"
#include "recommendation_fixtures.h"
#include "service_process_harness.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

namespace {

bool writeJson(const QString& path, const QJsonDocument& doc)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray payload = doc.toJson(QJsonDocument::Compact);
    return file.write(payload) == payload.size();
}

// Catalog, graph and settings for a 6-dimensional test corpus.
bool seedDataDir(const QString& dataDir)
{
    const QJsonArray catalog = hr::test::clusteredCatalogJson(3, 8, 6);
    QJsonArray edges;
    for (const QJsonValue& value : catalog) {
        const QString id = value.toObject().value(QStringLiteral("id")).toString();
        if (id == QStringLiteral("c0-0")) {
            continue;
        }
        QJsonObject edge;
        edge[QStringLiteral("source")] = QStringLiteral("c0-0");
        edge[QStringLiteral("target")] = id;
        edge[QStringLiteral("weight")] = 0.8;
        edges.append(edge);
    }

    QJsonObject settings;
    settings[QStringLiteral("embeddingDim")] = 6;

    const QDir dir(dataDir);
    return writeJson(dir.filePath(QStringLiteral("catalog.json")), QJsonDocument(catalog))
        && writeJson(dir.filePath(QStringLiteral("graph.json")), QJsonDocument(edges))
        && writeJson(dir.filePath(QStringLiteral("settings.json")), QJsonDocument(settings));
}

QJsonObject params(std::initializer_list<std::pair<QString, QJsonValue>> values)
{
    QJsonObject out;
    for (const auto& entry : values) {
        out.insert(entry.first, entry.second);
    }
    return out;
}

} // namespace

class TestRecommenderServiceIpc : public QObject {
    Q_OBJECT

private slots:
    void testRecommenderIpcContract();
    void testReloadModelPicksUpNewWeights();
};

void TestRecommenderServiceIpc::testRecommenderIpcContract()
{
    QTemporaryDir tempHome;
    QVERIFY(tempHome.isValid());
    const QString dataDir = QDir(tempHome.path()).filePath(QStringLiteral("hybridrec"));
    QVERIFY(QDir().mkpath(dataDir));
    QVERIFY(seedDataDir(dataDir));

    hr::test::ServiceProcessHarness harness(QStringLiteral("recommender"),
                                            QStringLiteral("hybridrec-recommender"));
    hr::test::ServiceLaunchConfig launch;
    launch.homeDir = tempHome.path();
    launch.dataDir = dataDir;
    launch.startTimeoutMs = 20000;
    launch.readyTimeoutMs = 30000;
    QVERIFY2(harness.start(launch), "Failed to start recommender service");

    {
        const QJsonObject response = harness.request(QStringLiteral("ping"));
        QVERIFY(hr::test::isResponse(response));
        QCOMPARE(hr::test::resultPayload(response).value(QStringLiteral("service")).toString(),
                 QStringLiteral("recommender"));
    }

    {
        const QJsonObject p = params({{QStringLiteral("userId"), QStringLiteral("alice")},
                                      {QStringLiteral("resourceId"), QStringLiteral("c0-0")},
                                      {QStringLiteral("interactionType"), QStringLiteral("annotation")}});
        QVERIFY(hr::test::isResponse(harness.request(QStringLiteral("trackInteraction"), p)));
        const QJsonObject response = harness.request(QStringLiteral("trackInteraction"), p);
        QVERIFY(hr::test::isResponse(response));
        const QJsonObject stored = hr::test::resultPayload(response);
        QCOMPARE(stored.value(QStringLiteral("returnVisits")).toInt(), 1);
        QVERIFY(qFuzzyCompare(stored.value(QStringLiteral("interactionStrength")).toDouble(), 0.7));
        QVERIFY(stored.value(QStringLiteral("isPositive")).toBool());
    }

    {
        const QJsonObject response = harness.request(
            QStringLiteral("trackInteraction"),
            params({{QStringLiteral("userId"), QStringLiteral("alice")},
                    {QStringLiteral("resourceId"), QStringLiteral("c0-1")},
                    {QStringLiteral("interactionType"), QStringLiteral("like")}}));
        QVERIFY(hr::test::isError(response));
        const QJsonObject error = hr::test::errorPayload(response);
        QCOMPARE(error.value(QStringLiteral("code")).toInt(), static_cast<int>(hr::IpcErrorCode::InvalidParams));
        QVERIFY(error.value(QStringLiteral("message")).toString().contains(QStringLiteral("INVALID_INTERACTION_TYPE")));
    }

    QString firstRecommendation;
    {
        const QJsonObject response = harness.request(
            QStringLiteral("getRecommendations"),
            params({{QStringLiteral("userId"), QStringLiteral("alice")},
                    {QStringLiteral("limit"), 5}}));
        QVERIFY(hr::test::isResponse(response));
        const QJsonObject payload = hr::test::resultPayload(response);
        const QJsonArray items = payload.value(QStringLiteral("recommendations")).toArray();
        const QJsonObject metadata = payload.value(QStringLiteral("metadata")).toObject();
        QCOMPARE(items.size(), 5);
        QCOMPARE(metadata.value(QStringLiteral("count")).toInt(), 5);
        QVERIFY(!metadata.value(QStringLiteral("coldStart")).toBool());
        QCOMPARE(metadata.value(QStringLiteral("interactionCount")).toInt(), 2);
        for (const QJsonValue& item : items) {
            QVERIFY(item.toObject().value(QStringLiteral("resourceId")).toString() != QStringLiteral("c0-0"));
        }
        firstRecommendation = items.at(0).toObject().value(QStringLiteral("resourceId")).toString();
        QCOMPARE(items.at(0).toObject().value(QStringLiteral("rank")).toInt(), 1);
    }

    {
        const QJsonObject response = harness.request(
            QStringLiteral("getRecommendations"),
            params({{QStringLiteral("userId"), QStringLiteral("alice")},
                    {QStringLiteral("diversity"), 2.0}}));
        QVERIFY(hr::test::isError(response));
        QVERIFY(hr::test::errorPayload(response).value(QStringLiteral("message")).toString()
                    .contains(QStringLiteral("INVALID_PREFERENCE_RANGE")));
    }

    {
        const QJsonObject rejected = harness.request(
            QStringLiteral("updateProfile"),
            params({{QStringLiteral("userId"), QStringLiteral("alice")},
                    {QStringLiteral("noveltyPreference"), 1.5}}));
        QVERIFY(hr::test::isError(rejected));

        const QJsonObject response = harness.request(
            QStringLiteral("updateProfile"),
            params({{QStringLiteral("userId"), QStringLiteral("alice")},
                    {QStringLiteral("diversityPreference"), 0.9},
                    {QStringLiteral("excludedSources"), QJsonArray{QStringLiteral("Source-2")}}}));
        QVERIFY(hr::test::isResponse(response));

        const QJsonObject profile = hr::test::resultPayload(
            harness.request(QStringLiteral("getProfile"),
                            params({{QStringLiteral("userId"), QStringLiteral("alice")}})));
        QCOMPARE(profile.value(QStringLiteral("diversityPreference")).toDouble(), 0.9);
        QCOMPARE(profile.value(QStringLiteral("noveltyPreference")).toDouble(), 0.3);
        QCOMPARE(profile.value(QStringLiteral("excludedSources")).toArray().first().toString(),
                 QStringLiteral("source-2"));
        QCOMPARE(profile.value(QStringLiteral("totalInteractions")).toInt(), 2);
    }

    {
        const QJsonObject missing = harness.request(
            QStringLiteral("submitFeedback"),
            params({{QStringLiteral("userId"), QStringLiteral("alice")},
                    {QStringLiteral("resourceId"), QStringLiteral("not-in-catalog")},
                    {QStringLiteral("wasClicked"), true}}));
        QVERIFY(hr::test::isError(missing));
        QCOMPARE(hr::test::errorPayload(missing).value(QStringLiteral("code")).toInt(),
                 static_cast<int>(hr::IpcErrorCode::NotFound));

        const QJsonObject response = harness.request(
            QStringLiteral("submitFeedback"),
            params({{QStringLiteral("userId"), QStringLiteral("alice")},
                    {QStringLiteral("resourceId"), firstRecommendation},
                    {QStringLiteral("wasClicked"), true},
                    {QStringLiteral("wasUseful"), true}}));
        QVERIFY(hr::test::isResponse(response));
        const QJsonObject feedback = hr::test::resultPayload(response);
        QVERIFY(feedback.value(QStringLiteral("wasClicked")).toBool());
        QCOMPARE(feedback.value(QStringLiteral("rankPosition")).toInt(), 1);
    }

    {
        const QJsonObject response = harness.request(
            QStringLiteral("getMetrics"),
            params({{QStringLiteral("userId"), QStringLiteral("alice")}}));
        QVERIFY(hr::test::isResponse(response));
        const QJsonObject metrics = hr::test::resultPayload(response);
        QCOMPARE(metrics.value(QStringLiteral("windowDays")).toInt(), 30);
        QCOMPARE(metrics.value(QStringLiteral("interactionCount")).toInt(), 2);
        QVERIFY(metrics.value(QStringLiteral("ctr")).toObject().value(QStringLiteral("ctr")).toDouble() > 0.0);
        QVERIFY(!metrics.value(QStringLiteral("model")).toObject().value(QStringLiteral("available")).toBool());
        QVERIFY(metrics.value(QStringLiteral("embeddingCache")).toObject().contains(QStringLiteral("hits")));

        QVERIFY(hr::test::isError(harness.request(QStringLiteral("getMetrics"), QJsonObject())));
    }

    {
        const QJsonObject response = harness.request(QStringLiteral("reloadModel"));
        QVERIFY(hr::test::isResponse(response));
        const QJsonObject payload = hr::test::resultPayload(response);
        QVERIFY(!payload.value(QStringLiteral("available")).toBool());
        QVERIFY(!payload.value(QStringLiteral("reloaded")).toBool());
    }

    {
        const QJsonObject response = harness.request(QStringLiteral("recommendEverything"));
        QVERIFY(hr::test::isError(response));
        QCOMPARE(hr::test::errorPayload(response).value(QStringLiteral("code")).toInt(),
                 static_cast<int>(hr::IpcErrorCode::NotFound));
    }

    harness.stop();
    QVERIFY(QFile::exists(QDir(dataDir).filePath(QStringLiteral("hybridrec.db"))));
}

void TestRecommenderServiceIpc::testReloadModelPicksUpNewWeights()
{
    QTemporaryDir tempHome;
    QVERIFY(tempHome.isValid());
    const QString dataDir = QDir(tempHome.path()).filePath(QStringLiteral("hybridrec"));
    QVERIFY(QDir().mkpath(dataDir));
    QVERIFY(seedDataDir(dataDir));

    hr::test::ServiceProcessHarness harness(QStringLiteral("recommender"),
                                            QStringLiteral("hybridrec-recommender"));
    hr::test::ServiceLaunchConfig launch;
    launch.homeDir = tempHome.path();
    launch.dataDir = dataDir;
    launch.startTimeoutMs = 20000;
    launch.readyTimeoutMs = 30000;
    QVERIFY2(harness.start(launch), "Failed to start recommender service");

    auto model = hr::CollaborativeModel::create({QStringLiteral("alice")},
                                                {QStringLiteral("c0-1"), QStringLiteral("c1-1")},
                                                4, {8}, 9);
    QVERIFY(model);
    model->setVersion(QStringLiteral("collaborative_test"));
    model->setItemCounts({{QStringLiteral("c1-1"), 4}});
    const QString modelPath =
        QDir(dataDir).filePath(QStringLiteral("models/collaborative/active/weights.json"));
    QString error;
    QVERIFY2(model->saveToFile(modelPath, &error), qPrintable(error));

    const QJsonObject reload = hr::test::resultPayload(harness.request(QStringLiteral("reloadModel")));
    QVERIFY(reload.value(QStringLiteral("reloaded")).toBool());
    QVERIFY(reload.value(QStringLiteral("available")).toBool());
    QCOMPARE(reload.value(QStringLiteral("version")).toString(), QStringLiteral("collaborative_test"));

    const QJsonObject metrics = hr::test::resultPayload(
        harness.request(QStringLiteral("getMetrics"),
                        params({{QStringLiteral("userId"), QStringLiteral("alice")}})));
    const QJsonArray popular = metrics.value(QStringLiteral("model")).toObject()
                                   .value(QStringLiteral("popularItems")).toArray();
    QCOMPARE(popular.size(), 1);
    QCOMPARE(popular.at(0).toObject().value(QStringLiteral("resourceId")).toString(), QStringLiteral("c1-1"));
}

QTEST_MAIN(TestRecommenderServiceIpc)
#include "test_recommender_service_ipc.moc"
