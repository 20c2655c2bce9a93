#include "core/feedback/interaction_recorder.h"
#include "core/learning/collaborative_trainer.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/store/sqlite_store.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QTextStream>

#include <cstdio>

// Offline trainer for the collaborative model. Reads positive interactions
// from the recommender database, trains a candidate and promotes it over the
// active weights only when it wins on the holdout split.
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("hybridrec-train"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    hr::Settings settings = hr::SettingsManager::load().value_or(hr::Settings{});
    hr::SettingsManager::applyDefaultPaths(settings);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Train the collaborative recommendation model"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbOption(QStringLiteral("db"),
        QStringLiteral("Interaction database."), QStringLiteral("path"), settings.dbPath);
    const QCommandLineOption modelOption(QStringLiteral("model"),
        QStringLiteral("Active model weights to evaluate against and replace."),
        QStringLiteral("path"), settings.modelPath);
    const QCommandLineOption epochsOption(QStringLiteral("epochs"),
        QStringLiteral("Training epochs."), QStringLiteral("n"), QStringLiteral("5"));
    const QCommandLineOption negativesOption(QStringLiteral("negatives"),
        QStringLiteral("Sampled negatives per positive."), QStringLiteral("n"), QStringLiteral("4"));
    const QCommandLineOption seedOption(QStringLiteral("seed"),
        QStringLiteral("Random seed."), QStringLiteral("n"), QStringLiteral("42"));
    const QCommandLineOption dimOption(QStringLiteral("embedding-dim"),
        QStringLiteral("User and item embedding width."), QStringLiteral("n"),
        QString::number(hr::CollaborativeModel::kDefaultEmbeddingDim));
    parser.addOptions({dbOption, modelOption, epochsOption, negativesOption, seedOption, dimOption});
    parser.process(app);

    hr::CollaborativeTrainer::TrainConfig config;
    bool ok = true;
    bool allOk = true;
    config.epochs = parser.value(epochsOption).toInt(&ok);
    allOk = allOk && ok && config.epochs > 0;
    config.negativeRatio = parser.value(negativesOption).toInt(&ok);
    allOk = allOk && ok && config.negativeRatio >= 0;
    config.seed = parser.value(seedOption).toUInt(&ok);
    allOk = allOk && ok;
    config.embeddingDim = parser.value(dimOption).toInt(&ok);
    allOk = allOk && ok && config.embeddingDim > 0;
    if (!allOk) {
        std::fprintf(stderr, "Invalid numeric option\n");
        return 2;
    }

    const QString dbPath = parser.value(dbOption);
    const QString modelPath = parser.value(modelOption);
    if (modelPath.isEmpty()) {
        std::fprintf(stderr, "No model path configured\n");
        return 2;
    }

    auto store = hr::SQLiteStore::open(dbPath);
    if (!store) {
        LOG_ERROR(hrModel, "Failed to open database at %s", qUtf8Printable(dbPath));
        return 1;
    }

    hr::InteractionRecorder recorder(store->rawDb());
    const std::vector<hr::UserInteraction> positives = recorder.allPositiveInteractions();
    LOG_INFO(hrModel, "Training on %d positive interactions from %s",
             static_cast<int>(positives.size()), qUtf8Printable(dbPath));

    hr::CollaborativeTrainer trainer(config);
    hr::CollaborativeTrainer::TrainReport report;
    const bool promoted = trainer.trainAndPromote(positives, modelPath, &report);

    QTextStream out(stdout);
    out << QJsonDocument(report.toJson()).toJson(QJsonDocument::Indented);
    out.flush();

    if (!promoted && report.rejectReason == QLatin1String("persist_active_model_failed")) {
        return 1;
    }
    return 0;
}
