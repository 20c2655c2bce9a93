#pragma once

#include "core/feedback/interaction_types.h"
#include "core/learning/collaborative_model.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <vector>

namespace hr {

class CollaborativeTrainer {
public:
    struct TrainConfig {
        int epochs = 5;
        int negativeRatio = 4;
        double learningRate = 0.05;
        quint32 seed = 42;
        int embeddingDim = CollaborativeModel::kDefaultEmbeddingDim;
        std::vector<int> hiddenLayers = CollaborativeModel::defaultHiddenLayers();
        int minPositives = 10;
    };

    struct Example {
        int userIdx = 0;
        int itemIdx = 0;
        double label = 0.0;
    };

    struct TrainReport {
        int users = 0;
        int items = 0;
        int positives = 0;
        int examples = 0;
        double trainLoss = 0.0;
        double holdoutLoss = 0.0;
        double activeHoldoutLoss = 0.0;
        bool promoted = false;
        QString version;
        QString rejectReason;

        QJsonObject toJson() const;
    };

    explicit CollaborativeTrainer(TrainConfig config = {});

    // Trains a fresh model on positive interactions plus sampled negatives.
    // Returns nullptr when there is too little data; report says why.
    std::unique_ptr<CollaborativeModel> train(const std::vector<UserInteraction>& positives,
                                              TrainReport* report) const;

    // Trains, evaluates against the model at modelPath (if any) and writes the
    // candidate over it only when it wins the holdout comparison.
    bool trainAndPromote(const std::vector<UserInteraction>& positives,
                         const QString& modelPath,
                         TrainReport* report) const;

    const TrainConfig& config() const { return m_config; }

    // Mean binary cross-entropy of `model` on examples indexed against
    // `indexModel`. Pairs unknown to `model` are skipped.
    static double meanLoss(const CollaborativeModel& model,
                           const CollaborativeModel& indexModel,
                           const std::vector<Example>& examples,
                           int* usedOut = nullptr);

private:
    std::unique_ptr<CollaborativeModel> trainWithHoldout(const std::vector<UserInteraction>& positives,
                                                         TrainReport* report,
                                                         std::vector<Example>* holdout) const;
    std::vector<Example> buildExamples(const CollaborativeModel& model,
                                       const std::vector<UserInteraction>& positives) const;

    TrainConfig m_config;
};

} // namespace hr
