#pragma once

#include "core/learning/collaborative_model.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace hr {

// Either a probability or an explicit "no model / unknown id" marker. The
// ranking path treats an unavailable score as a missing component.
class CollaborativeScore {
public:
    static CollaborativeScore scored(double value) { return CollaborativeScore(true, value); }
    static CollaborativeScore unavailable() { return CollaborativeScore(false, 0.0); }

    bool isAvailable() const { return m_available; }
    double value() const { return m_value; }
    double valueOr(double fallback) const { return m_available ? m_value : fallback; }

private:
    CollaborativeScore(bool available, double value) : m_available(available), m_value(value) {}

    bool m_available = false;
    double m_value = 0.0;
};

// Serves predictions from an immutable model snapshot. Swapping the
// snapshot does not disturb predictions already in flight.
class CollaborativeScorer {
public:
    explicit CollaborativeScorer(QString modelPath = {});

    // Replaces the snapshot with the model at modelPath. On failure the
    // previous snapshot stays active.
    bool load(QString* errorOut = nullptr);
    void setModel(std::shared_ptr<const CollaborativeModel> model);
    void clear();

    std::shared_ptr<const CollaborativeModel> snapshot() const;
    bool hasModel() const { return snapshot() != nullptr; }
    QString modelVersion() const;
    const QString& modelPath() const { return m_modelPath; }

    CollaborativeScore predict(const QString& userId, const QString& itemId) const;
    QHash<QString, CollaborativeScore> predictBatch(const QString& userId,
                                                    const QStringList& itemIds) const;

    // Most interacted items in the training data, count descending.
    std::vector<std::pair<QString, int>> popularItems(int k) const;

private:
    QString m_modelPath;
    mutable std::mutex m_mutex;
    std::shared_ptr<const CollaborativeModel> m_model;
};

} // namespace hr
