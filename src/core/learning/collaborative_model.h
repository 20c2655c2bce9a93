#pragma once

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <memory>
#include <vector>

namespace hr {

// Fully connected layer, weights stored row-major as [outputs][inputs].
struct DenseLayer {
    int inputs = 0;
    int outputs = 0;
    std::vector<double> weights;
    std::vector<double> bias;
};

// Neural collaborative filtering model: user and item embedding tables,
// concatenated and fed through a ReLU MLP with a sigmoid output unit.
class CollaborativeModel {
public:
    static constexpr int kDefaultEmbeddingDim = 64;
    static constexpr int kFormatVersion = 1;
    static std::vector<int> defaultHiddenLayers() { return {128, 64, 32}; }

    // Fresh model with weights drawn from a generator seeded with `seed`.
    static std::unique_ptr<CollaborativeModel> create(const QStringList& userIds,
                                                      const QStringList& itemIds,
                                                      int embeddingDim,
                                                      const std::vector<int>& hiddenLayers,
                                                      quint32 seed);

    // Every shape is checked; any mismatch or non-finite parameter rejects
    // the document.
    static std::unique_ptr<CollaborativeModel> fromJson(const QJsonObject& json,
                                                        QString* errorOut = nullptr);
    static std::unique_ptr<CollaborativeModel> loadFromFile(const QString& path,
                                                            QString* errorOut = nullptr);

    QJsonObject toJson() const;
    bool saveToFile(const QString& path, QString* errorOut = nullptr) const;

    int userIndex(const QString& userId) const { return m_userIndex.value(userId, -1); }
    int itemIndex(const QString& itemId) const { return m_itemIndex.value(itemId, -1); }
    const QStringList& userIds() const { return m_userIds; }
    const QStringList& itemIds() const { return m_itemIds; }
    int embeddingDim() const { return m_embeddingDim; }
    const std::vector<DenseLayer>& layers() const { return m_layers; }

    // Probability in [0,1]. Indices must be valid.
    double predict(int userIdx, int itemIdx) const;

    // One SGD step on binary cross-entropy. Returns the loss before the step.
    double trainStep(int userIdx, int itemIdx, double label, double learningRate);

    QString version() const { return m_version; }
    void setVersion(const QString& version) { m_version = version; }
    const QJsonObject& trainingMetrics() const { return m_trainingMetrics; }
    void setTrainingMetrics(const QJsonObject& metrics) { m_trainingMetrics = metrics; }

    // Positive interaction counts seen in training, keyed by item.
    const QHash<QString, int>& itemCounts() const { return m_itemCounts; }
    void setItemCounts(QHash<QString, int> counts) { m_itemCounts = std::move(counts); }

    static double sigmoid(double x);

private:
    CollaborativeModel() = default;

    void rebuildIndexes();
    double forward(int userIdx, int itemIdx, std::vector<std::vector<double>>* activations) const;

    QStringList m_userIds;
    QStringList m_itemIds;
    QHash<QString, int> m_userIndex;
    QHash<QString, int> m_itemIndex;
    int m_embeddingDim = kDefaultEmbeddingDim;
    std::vector<double> m_userEmbeddings;   // [users][dim]
    std::vector<double> m_itemEmbeddings;   // [items][dim]
    std::vector<DenseLayer> m_layers;       // hidden layers then the output unit
    QHash<QString, int> m_itemCounts;
    QString m_version;
    QString m_updatedAt;
    QJsonObject m_trainingMetrics;
};

} // namespace hr
