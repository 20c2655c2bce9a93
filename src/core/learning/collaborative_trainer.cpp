#include "core/learning/collaborative_trainer.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QRandomGenerator>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace hr {

namespace {

constexpr double kPromotionMargin = 0.002;
constexpr int kNegativeAttemptsPerSample = 10;

QString candidatePathFor(const QString& modelPath)
{
    QDir activeDir = QFileInfo(modelPath).absoluteDir();
    QDir modelRoot = activeDir;
    if (modelRoot.cdUp()) {
        return modelRoot.filePath(QStringLiteral("candidate/weights.json"));
    }
    return activeDir.filePath(QStringLiteral("candidate/weights.json"));
}

void setReject(CollaborativeTrainer::TrainReport* report, const QString& reason)
{
    if (report) {
        report->rejectReason = reason;
    }
}

} // namespace

QJsonObject CollaborativeTrainer::TrainReport::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("users")] = users;
    json[QStringLiteral("items")] = items;
    json[QStringLiteral("positives")] = positives;
    json[QStringLiteral("examples")] = examples;
    json[QStringLiteral("trainLoss")] = trainLoss;
    json[QStringLiteral("holdoutLoss")] = holdoutLoss;
    json[QStringLiteral("activeHoldoutLoss")] = activeHoldoutLoss;
    json[QStringLiteral("promoted")] = promoted;
    json[QStringLiteral("version")] = version;
    json[QStringLiteral("rejectReason")] = rejectReason;
    return json;
}

CollaborativeTrainer::CollaborativeTrainer(TrainConfig config)
    : m_config(std::move(config))
{
}

std::vector<CollaborativeTrainer::Example> CollaborativeTrainer::buildExamples(
    const CollaborativeModel& model,
    const std::vector<UserInteraction>& positives) const
{
    QHash<int, QSet<int>> seenByUser;
    for (const UserInteraction& interaction : positives) {
        seenByUser[model.userIndex(interaction.userId)].insert(model.itemIndex(interaction.resourceId));
    }

    QRandomGenerator rng(m_config.seed + 1);
    const int itemCount = model.itemIds().size();
    const int ratio = std::max(0, m_config.negativeRatio);

    std::vector<Example> examples;
    examples.reserve(positives.size() * static_cast<size_t>(ratio + 1));
    for (const UserInteraction& interaction : positives) {
        const int userIdx = model.userIndex(interaction.userId);
        const int itemIdx = model.itemIndex(interaction.resourceId);
        examples.push_back({userIdx, itemIdx, 1.0});

        const QSet<int>& seen = seenByUser[userIdx];
        if (seen.size() >= itemCount) {
            continue;
        }
        int sampled = 0;
        int attempts = 0;
        while (sampled < ratio && attempts < ratio * kNegativeAttemptsPerSample) {
            ++attempts;
            const int candidate = static_cast<int>(rng.bounded(static_cast<quint32>(itemCount)));
            if (seen.contains(candidate)) {
                continue;
            }
            examples.push_back({userIdx, candidate, 0.0});
            ++sampled;
        }
    }

    std::shuffle(examples.begin(), examples.end(), rng);
    return examples;
}

double CollaborativeTrainer::meanLoss(const CollaborativeModel& model,
                                      const CollaborativeModel& indexModel,
                                      const std::vector<Example>& examples,
                                      int* usedOut)
{
    double loss = 0.0;
    int used = 0;
    for (const Example& ex : examples) {
        const int userIdx = model.userIndex(indexModel.userIds().at(ex.userIdx));
        const int itemIdx = model.itemIndex(indexModel.itemIds().at(ex.itemIdx));
        if (userIdx < 0 || itemIdx < 0) {
            continue;
        }
        const double p = std::clamp(model.predict(userIdx, itemIdx), 1e-7, 1.0 - 1e-7);
        loss += -(ex.label * std::log(p) + (1.0 - ex.label) * std::log(1.0 - p));
        ++used;
    }
    if (usedOut) {
        *usedOut = used;
    }
    return used > 0 ? loss / static_cast<double>(used) : 0.0;
}

std::unique_ptr<CollaborativeModel> CollaborativeTrainer::train(const std::vector<UserInteraction>& positives,
                                                                TrainReport* report) const
{
    std::vector<Example> holdout;
    return trainWithHoldout(positives, report, &holdout);
}

std::unique_ptr<CollaborativeModel> CollaborativeTrainer::trainWithHoldout(
    const std::vector<UserInteraction>& positives,
    TrainReport* report,
    std::vector<Example>* holdout) const
{
    TrainReport local;
    TrainReport* out = report ? report : &local;
    *out = TrainReport{};

    QSet<QString> userSet;
    QSet<QString> itemSet;
    QHash<QString, int> itemCounts;
    std::vector<UserInteraction> usable;
    usable.reserve(positives.size());
    for (const UserInteraction& interaction : positives) {
        if (interaction.userId.isEmpty() || interaction.resourceId.isEmpty()) {
            continue;
        }
        userSet.insert(interaction.userId);
        itemSet.insert(interaction.resourceId);
        ++itemCounts[interaction.resourceId];
        usable.push_back(interaction);
    }

    out->positives = static_cast<int>(usable.size());
    out->users = userSet.size();
    out->items = itemSet.size();

    if (out->positives < std::max(1, m_config.minPositives)) {
        setReject(out, QStringLiteral("insufficient_examples"));
        return nullptr;
    }
    if (out->items < 2) {
        setReject(out, QStringLiteral("insufficient_items"));
        return nullptr;
    }

    QStringList userIds(userSet.begin(), userSet.end());
    QStringList itemIds(itemSet.begin(), itemSet.end());
    userIds.sort();
    itemIds.sort();

    std::unique_ptr<CollaborativeModel> model = CollaborativeModel::create(
        userIds, itemIds, m_config.embeddingDim, m_config.hiddenLayers, m_config.seed);
    if (!model) {
        setReject(out, QStringLiteral("invalid_model_shape"));
        return nullptr;
    }

    const std::vector<Example> examples = buildExamples(*model, usable);
    std::vector<Example> trainSet;
    holdout->clear();
    for (size_t i = 0; i < examples.size(); ++i) {
        if (i % 5 == 0) {
            holdout->push_back(examples[i]);
        } else {
            trainSet.push_back(examples[i]);
        }
    }
    out->examples = static_cast<int>(examples.size());
    if (trainSet.empty() || holdout->empty()) {
        setReject(out, QStringLiteral("invalid_train_holdout_split"));
        return nullptr;
    }

    QRandomGenerator rng(m_config.seed + 2);
    const double lr = std::clamp(m_config.learningRate, 1e-5, 1.0);
    const int epochs = std::max(1, m_config.epochs);
    for (int epoch = 0; epoch < epochs; ++epoch) {
        std::shuffle(trainSet.begin(), trainSet.end(), rng);
        double epochLoss = 0.0;
        for (const Example& ex : trainSet) {
            epochLoss += model->trainStep(ex.userIdx, ex.itemIdx, ex.label, lr);
        }
        out->trainLoss = epochLoss / static_cast<double>(trainSet.size());
        LOG_DEBUG(hrModel, "epoch %d/%d loss %.5f", epoch + 1, epochs, out->trainLoss);
    }

    out->holdoutLoss = meanLoss(*model, *model, *holdout);
    if (!std::isfinite(out->trainLoss) || !std::isfinite(out->holdoutLoss)) {
        setReject(out, QStringLiteral("candidate_stability_invalid_eval"));
        return nullptr;
    }

    out->version = QStringLiteral("collaborative_%1")
        .arg(QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMddhhmmss")));
    model->setVersion(out->version);
    model->setItemCounts(itemCounts);

    QJsonObject metrics;
    metrics[QStringLiteral("examples")] = out->examples;
    metrics[QStringLiteral("trainLoss")] = out->trainLoss;
    metrics[QStringLiteral("holdoutLoss")] = out->holdoutLoss;
    metrics[QStringLiteral("epochs")] = epochs;
    metrics[QStringLiteral("negativeRatio")] = m_config.negativeRatio;
    metrics[QStringLiteral("seed")] = static_cast<qint64>(m_config.seed);
    model->setTrainingMetrics(metrics);
    return model;
}

bool CollaborativeTrainer::trainAndPromote(const std::vector<UserInteraction>& positives,
                                           const QString& modelPath,
                                           TrainReport* report) const
{
    TrainReport local;
    TrainReport* out = report ? report : &local;

    std::vector<Example> holdout;
    std::unique_ptr<CollaborativeModel> candidate = trainWithHoldout(positives, out, &holdout);
    if (!candidate) {
        LOG_INFO(hrModel, "Collaborative training rejected: %s", qUtf8Printable(out->rejectReason));
        return false;
    }

    QString error;
    if (!candidate->saveToFile(candidatePathFor(modelPath), &error)) {
        LOG_WARN(hrModel, "Failed to write candidate model: %s", qUtf8Printable(error));
    }

    bool haveActive = false;
    std::unique_ptr<CollaborativeModel> active = CollaborativeModel::loadFromFile(modelPath);
    if (active) {
        int used = 0;
        out->activeHoldoutLoss = meanLoss(*active, *candidate, holdout, &used);
        haveActive = used > 0 && std::isfinite(out->activeHoldoutLoss);
    }

    const bool promote = !haveActive || (out->holdoutLoss + kPromotionMargin < out->activeHoldoutLoss);
    if (!promote) {
        setReject(out, QStringLiteral("candidate_not_better_than_active"));
        return false;
    }

    if (!candidate->saveToFile(modelPath, &error)) {
        LOG_WARN(hrModel, "Failed to persist active model: %s", qUtf8Printable(error));
        setReject(out, QStringLiteral("persist_active_model_failed"));
        return false;
    }

    out->promoted = true;
    LOG_INFO(hrModel, "Promoted collaborative model %s (holdout loss %.5f)",
             qUtf8Printable(out->version), out->holdoutLoss);
    return true;
}

} // namespace hr
