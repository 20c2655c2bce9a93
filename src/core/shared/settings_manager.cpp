#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace hr {

namespace {

int readInt(const QJsonObject& json, const char* key, int fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toInt(fallback) : fallback;
}

double readDouble(const QJsonObject& json, const char* key, double fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toDouble(fallback) : fallback;
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    const QString filePath = settingsFilePath();
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(hrCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(hrCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    const QString filePath = settingsFilePath();
    const QString parentDir = QFileInfo(filePath).absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(hrCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(hrCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(hrCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("HYBRIDREC_SETTINGS").trimmed();
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    return dataDirectory() + QStringLiteral("/settings.json");
}

QString SettingsManager::dataDirectory()
{
    const QString envDataDir = qEnvironmentVariable("HYBRIDREC_DATA_DIR").trimmed();
    if (!envDataDir.isEmpty()) {
        return QDir::cleanPath(envDataDir);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/hybridrec");
}

void SettingsManager::applyDefaultPaths(Settings& settings)
{
    const QDir dataDir(dataDirectory());
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = dataDir.filePath(QStringLiteral("hybridrec.db"));
    }
    if (settings.catalogPath.isEmpty()) {
        settings.catalogPath = dataDir.filePath(QStringLiteral("catalog.json"));
    }
    if (settings.graphPath.isEmpty()) {
        settings.graphPath = dataDir.filePath(QStringLiteral("graph.json"));
    }
    if (settings.modelPath.isEmpty()) {
        settings.modelPath = dataDir.filePath(QStringLiteral("models/collaborative/active/weights.json"));
    }
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("catalogPath"), settings.catalogPath);
    json.insert(QStringLiteral("graphPath"), settings.graphPath);
    json.insert(QStringLiteral("modelPath"), settings.modelPath);
    json.insert(QStringLiteral("embeddingDim"), settings.embeddingDim);
    json.insert(QStringLiteral("userEmbeddingTtlSeconds"), settings.userEmbeddingTtlSeconds);
    json.insert(QStringLiteral("userEmbeddingMaxInteractions"), settings.userEmbeddingMaxInteractions);
    json.insert(QStringLiteral("sourceTimeoutMs"), settings.sourceTimeoutMs);
    json.insert(QStringLiteral("perSourceLimit"), settings.perSourceLimit);
    json.insert(QStringLiteral("mergedCandidateLimit"), settings.mergedCandidateLimit);
    json.insert(QStringLiteral("contentSimilarityThreshold"), settings.contentSimilarityThreshold);
    json.insert(QStringLiteral("graphMaxHops"), settings.graphMaxHops);
    json.insert(QStringLiteral("graphSeedCount"), settings.graphSeedCount);
    json.insert(QStringLiteral("collaborativeMinInteractions"), settings.collaborativeMinInteractions);
    json.insert(QStringLiteral("defaultWeights"), settings.defaultWeights.toJson());
    json.insert(QStringLiteral("noveltyBoostFactor"), settings.noveltyBoostFactor);
    json.insert(QStringLiteral("noveltyFloorFraction"), settings.noveltyFloorFraction);
    json.insert(QStringLiteral("mmrWindowMultiplier"), settings.mmrWindowMultiplier);
    json.insert(QStringLiteral("preferenceLearningInterval"), settings.preferenceLearningInterval);
    json.insert(QStringLiteral("preferenceLookbackDays"), settings.preferenceLookbackDays);
    json.insert(QStringLiteral("preferenceMaxRecords"), settings.preferenceMaxRecords);
    json.insert(QStringLiteral("preferredAuthorCount"), settings.preferredAuthorCount);
    json.insert(QStringLiteral("feedbackRetentionDays"), settings.feedbackRetentionDays);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.catalogPath = json.value(QStringLiteral("catalogPath")).toString(settings.catalogPath);
    settings.graphPath = json.value(QStringLiteral("graphPath")).toString(settings.graphPath);
    settings.modelPath = json.value(QStringLiteral("modelPath")).toString(settings.modelPath);

    settings.embeddingDim = readInt(json, "embeddingDim", settings.embeddingDim);
    settings.userEmbeddingTtlSeconds =
        readInt(json, "userEmbeddingTtlSeconds", settings.userEmbeddingTtlSeconds);
    settings.userEmbeddingMaxInteractions =
        readInt(json, "userEmbeddingMaxInteractions", settings.userEmbeddingMaxInteractions);

    settings.sourceTimeoutMs = readInt(json, "sourceTimeoutMs", settings.sourceTimeoutMs);
    settings.perSourceLimit = readInt(json, "perSourceLimit", settings.perSourceLimit);
    settings.mergedCandidateLimit = readInt(json, "mergedCandidateLimit", settings.mergedCandidateLimit);
    settings.contentSimilarityThreshold =
        readDouble(json, "contentSimilarityThreshold", settings.contentSimilarityThreshold);
    settings.graphMaxHops = readInt(json, "graphMaxHops", settings.graphMaxHops);
    settings.graphSeedCount = readInt(json, "graphSeedCount", settings.graphSeedCount);
    settings.collaborativeMinInteractions =
        readInt(json, "collaborativeMinInteractions", settings.collaborativeMinInteractions);

    const QJsonValue weightsValue = json.value(QStringLiteral("defaultWeights"));
    if (weightsValue.isObject()) {
        Error error;
        const auto weights = HybridWeights::fromJson(weightsValue.toObject(), &error);
        if (weights) {
            settings.defaultWeights = *weights;
        } else {
            LOG_WARN(hrCore, "Ignoring invalid defaultWeights in settings: %s",
                     qUtf8Printable(error.message));
        }
    }

    settings.noveltyBoostFactor = readDouble(json, "noveltyBoostFactor", settings.noveltyBoostFactor);
    settings.noveltyFloorFraction = readDouble(json, "noveltyFloorFraction", settings.noveltyFloorFraction);
    settings.mmrWindowMultiplier = readInt(json, "mmrWindowMultiplier", settings.mmrWindowMultiplier);

    settings.preferenceLearningInterval =
        readInt(json, "preferenceLearningInterval", settings.preferenceLearningInterval);
    settings.preferenceLookbackDays = readInt(json, "preferenceLookbackDays", settings.preferenceLookbackDays);
    settings.preferenceMaxRecords = readInt(json, "preferenceMaxRecords", settings.preferenceMaxRecords);
    settings.preferredAuthorCount = readInt(json, "preferredAuthorCount", settings.preferredAuthorCount);

    settings.feedbackRetentionDays = readInt(json, "feedbackRetentionDays", settings.feedbackRetentionDays);

    return settings;
}

} // namespace hr
