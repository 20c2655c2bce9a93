#include "core/learning/collaborative_scorer.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace hr {

CollaborativeScorer::CollaborativeScorer(QString modelPath)
    : m_modelPath(std::move(modelPath))
{
}

bool CollaborativeScorer::load(QString* errorOut)
{
    if (m_modelPath.isEmpty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("no model path configured");
        }
        return false;
    }

    QString error;
    std::unique_ptr<CollaborativeModel> model = CollaborativeModel::loadFromFile(m_modelPath, &error);
    if (!model) {
        LOG_INFO(hrModel, "Collaborative model unavailable (%s): %s",
                 qUtf8Printable(m_modelPath), qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return false;
    }

    LOG_INFO(hrModel, "Loaded collaborative model %s (%d users, %d items)",
             qUtf8Printable(model->version()),
             static_cast<int>(model->userIds().size()),
             static_cast<int>(model->itemIds().size()));
    setModel(std::shared_ptr<const CollaborativeModel>(std::move(model)));
    return true;
}

void CollaborativeScorer::setModel(std::shared_ptr<const CollaborativeModel> model)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_model = std::move(model);
}

void CollaborativeScorer::clear()
{
    setModel(nullptr);
}

std::shared_ptr<const CollaborativeModel> CollaborativeScorer::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_model;
}

QString CollaborativeScorer::modelVersion() const
{
    const auto model = snapshot();
    return model ? model->version() : QString();
}

CollaborativeScore CollaborativeScorer::predict(const QString& userId, const QString& itemId) const
{
    const auto model = snapshot();
    if (!model) {
        return CollaborativeScore::unavailable();
    }
    const int userIdx = model->userIndex(userId);
    const int itemIdx = model->itemIndex(itemId);
    if (userIdx < 0 || itemIdx < 0) {
        return CollaborativeScore::unavailable();
    }
    return CollaborativeScore::scored(model->predict(userIdx, itemIdx));
}

QHash<QString, CollaborativeScore> CollaborativeScorer::predictBatch(const QString& userId,
                                                                    const QStringList& itemIds) const
{
    QHash<QString, CollaborativeScore> out;
    out.reserve(itemIds.size());

    const auto model = snapshot();
    const int userIdx = model ? model->userIndex(userId) : -1;
    for (const QString& itemId : itemIds) {
        if (userIdx < 0) {
            out.insert(itemId, CollaborativeScore::unavailable());
            continue;
        }
        const int itemIdx = model->itemIndex(itemId);
        out.insert(itemId, itemIdx < 0 ? CollaborativeScore::unavailable()
                                       : CollaborativeScore::scored(model->predict(userIdx, itemIdx)));
    }
    return out;
}

std::vector<std::pair<QString, int>> CollaborativeScorer::popularItems(int k) const
{
    std::vector<std::pair<QString, int>> out;
    const auto model = snapshot();
    if (!model || k <= 0) {
        return out;
    }

    const QHash<QString, int>& counts = model->itemCounts();
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        out.emplace_back(it.key(), it.value());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });
    if (out.size() > static_cast<size_t>(k)) {
        out.resize(static_cast<size_t>(k));
    }
    return out;
}

} // namespace hr
