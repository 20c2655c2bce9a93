#include "core/learning/collaborative_model.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRandomGenerator>
#include <QSaveFile>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace hr {

namespace {

constexpr double kEmbeddingInitRange = 0.1;
constexpr double kProbabilityEpsilon = 1e-7;

double uniform(QRandomGenerator& rng, double limit)
{
    return (rng.generateDouble() * 2.0 - 1.0) * limit;
}

void setErrorText(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

bool parseIdList(const QJsonValue& value, const char* key, QStringList* out, QString* errorOut)
{
    if (!value.isArray()) {
        setErrorText(errorOut, QStringLiteral("%1 must be an array").arg(QLatin1String(key)));
        return false;
    }
    QSet<QString> seen;
    for (const QJsonValue& entry : value.toArray()) {
        if (!entry.isString() || entry.toString().isEmpty()) {
            setErrorText(errorOut, QStringLiteral("%1 contains a non-string entry").arg(QLatin1String(key)));
            return false;
        }
        const QString id = entry.toString();
        if (seen.contains(id)) {
            setErrorText(errorOut, QStringLiteral("%1 contains duplicate id %2").arg(QLatin1String(key), id));
            return false;
        }
        seen.insert(id);
        out->append(id);
    }
    return true;
}

bool parseFiniteArray(const QJsonArray& array, int expected, std::vector<double>* out)
{
    if (array.size() != expected) {
        return false;
    }
    for (const QJsonValue& v : array) {
        if (!v.isDouble() || !std::isfinite(v.toDouble())) {
            return false;
        }
        out->push_back(v.toDouble());
    }
    return true;
}

bool parseEmbeddingTable(const QJsonValue& value, int rows, int dim, const char* key,
                         std::vector<double>* out, QString* errorOut)
{
    const QJsonArray table = value.toArray();
    if (!value.isArray() || table.size() != rows) {
        setErrorText(errorOut, QStringLiteral("%1 must have %2 rows").arg(QLatin1String(key)).arg(rows));
        return false;
    }
    out->reserve(static_cast<size_t>(rows) * static_cast<size_t>(dim));
    for (int r = 0; r < rows; ++r) {
        if (!parseFiniteArray(table.at(r).toArray(), dim, out)) {
            setErrorText(errorOut, QStringLiteral("%1 row %2 is malformed").arg(QLatin1String(key)).arg(r));
            return false;
        }
    }
    return true;
}

QJsonArray embeddingTableToJson(const std::vector<double>& table, int rows, int dim)
{
    QJsonArray out;
    for (int r = 0; r < rows; ++r) {
        QJsonArray row;
        for (int d = 0; d < dim; ++d) {
            row.append(table[static_cast<size_t>(r) * dim + d]);
        }
        out.append(row);
    }
    return out;
}

QJsonArray toJsonArray(const std::vector<double>& values)
{
    QJsonArray out;
    for (double v : values) {
        out.append(v);
    }
    return out;
}

} // namespace

double CollaborativeModel::sigmoid(double x)
{
    if (x >= 0.0) {
        const double z = std::exp(-x);
        return 1.0 / (1.0 + z);
    }
    const double z = std::exp(x);
    return z / (1.0 + z);
}

std::unique_ptr<CollaborativeModel> CollaborativeModel::create(const QStringList& userIds,
                                                               const QStringList& itemIds,
                                                               int embeddingDim,
                                                               const std::vector<int>& hiddenLayers,
                                                               quint32 seed)
{
    if (embeddingDim <= 0) {
        return nullptr;
    }
    for (int width : hiddenLayers) {
        if (width <= 0) {
            return nullptr;
        }
    }

    std::unique_ptr<CollaborativeModel> model(new CollaborativeModel());
    model->m_userIds = userIds;
    model->m_itemIds = itemIds;
    model->m_embeddingDim = embeddingDim;
    model->m_version = QStringLiteral("untrained");
    model->rebuildIndexes();

    QRandomGenerator rng(seed);
    model->m_userEmbeddings.resize(static_cast<size_t>(userIds.size()) * embeddingDim);
    for (double& v : model->m_userEmbeddings) {
        v = uniform(rng, kEmbeddingInitRange);
    }
    model->m_itemEmbeddings.resize(static_cast<size_t>(itemIds.size()) * embeddingDim);
    for (double& v : model->m_itemEmbeddings) {
        v = uniform(rng, kEmbeddingInitRange);
    }

    std::vector<int> widths = hiddenLayers;
    widths.push_back(1);
    int inputs = embeddingDim * 2;
    for (int outputs : widths) {
        DenseLayer layer;
        layer.inputs = inputs;
        layer.outputs = outputs;
        layer.weights.resize(static_cast<size_t>(inputs) * outputs);
        layer.bias.assign(static_cast<size_t>(outputs), 0.0);
        // He-uniform for the ReLU stack.
        const double limit = std::sqrt(6.0 / static_cast<double>(inputs));
        for (double& w : layer.weights) {
            w = uniform(rng, limit);
        }
        model->m_layers.push_back(std::move(layer));
        inputs = outputs;
    }
    return model;
}

void CollaborativeModel::rebuildIndexes()
{
    m_userIndex.clear();
    m_itemIndex.clear();
    for (int i = 0; i < m_userIds.size(); ++i) {
        m_userIndex.insert(m_userIds.at(i), i);
    }
    for (int i = 0; i < m_itemIds.size(); ++i) {
        m_itemIndex.insert(m_itemIds.at(i), i);
    }
}

std::unique_ptr<CollaborativeModel> CollaborativeModel::fromJson(const QJsonObject& json,
                                                                 QString* errorOut)
{
    const QJsonValue format = json.value(QStringLiteral("formatVersion"));
    if (format.isUndefined()) {
        setErrorText(errorOut, QStringLiteral("missing formatVersion"));
        return nullptr;
    }
    if (format.toInt(-1) != kFormatVersion) {
        setErrorText(errorOut, QStringLiteral("unsupported formatVersion %1").arg(format.toInt(-1)));
        return nullptr;
    }

    std::unique_ptr<CollaborativeModel> model(new CollaborativeModel());

    const int dim = json.value(QStringLiteral("embeddingDim")).toInt(0);
    if (dim <= 0) {
        setErrorText(errorOut, QStringLiteral("embeddingDim must be positive"));
        return nullptr;
    }
    model->m_embeddingDim = dim;

    if (!parseIdList(json.value(QStringLiteral("userIds")), "userIds", &model->m_userIds, errorOut)
        || !parseIdList(json.value(QStringLiteral("itemIds")), "itemIds", &model->m_itemIds, errorOut)) {
        return nullptr;
    }
    if (!parseEmbeddingTable(json.value(QStringLiteral("userEmbeddings")), model->m_userIds.size(), dim,
                             "userEmbeddings", &model->m_userEmbeddings, errorOut)
        || !parseEmbeddingTable(json.value(QStringLiteral("itemEmbeddings")), model->m_itemIds.size(), dim,
                                "itemEmbeddings", &model->m_itemEmbeddings, errorOut)) {
        return nullptr;
    }

    const QJsonArray layers = json.value(QStringLiteral("layers")).toArray();
    if (layers.isEmpty()) {
        setErrorText(errorOut, QStringLiteral("layers must not be empty"));
        return nullptr;
    }
    int expectedInputs = dim * 2;
    for (int l = 0; l < layers.size(); ++l) {
        const QJsonObject obj = layers.at(l).toObject();
        DenseLayer layer;
        layer.inputs = obj.value(QStringLiteral("inputs")).toInt(0);
        layer.outputs = obj.value(QStringLiteral("outputs")).toInt(0);
        if (layer.inputs != expectedInputs || layer.outputs <= 0) {
            setErrorText(errorOut, QStringLiteral("layer %1 has shape %2x%3, expected %4 inputs")
                                       .arg(l).arg(layer.inputs).arg(layer.outputs).arg(expectedInputs));
            return nullptr;
        }
        if (!parseFiniteArray(obj.value(QStringLiteral("weights")).toArray(),
                              layer.inputs * layer.outputs, &layer.weights)
            || !parseFiniteArray(obj.value(QStringLiteral("bias")).toArray(),
                                 layer.outputs, &layer.bias)) {
            setErrorText(errorOut, QStringLiteral("layer %1 parameters are malformed").arg(l));
            return nullptr;
        }
        expectedInputs = layer.outputs;
        model->m_layers.push_back(std::move(layer));
    }
    if (model->m_layers.back().outputs != 1) {
        setErrorText(errorOut, QStringLiteral("output layer must have exactly one unit"));
        return nullptr;
    }

    const QJsonValue hidden = json.value(QStringLiteral("hiddenLayers"));
    if (hidden.isArray()) {
        const QJsonArray widths = hidden.toArray();
        if (widths.size() != static_cast<int>(model->m_layers.size()) - 1) {
            setErrorText(errorOut, QStringLiteral("hiddenLayers does not match layers"));
            return nullptr;
        }
        for (int i = 0; i < widths.size(); ++i) {
            if (widths.at(i).toInt(-1) != model->m_layers[static_cast<size_t>(i)].outputs) {
                setErrorText(errorOut, QStringLiteral("hiddenLayers does not match layers"));
                return nullptr;
            }
        }
    }

    const QJsonObject counts = json.value(QStringLiteral("itemCounts")).toObject();
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        model->m_itemCounts.insert(it.key(), it.value().toInt(0));
    }

    model->m_version = json.value(QStringLiteral("version")).toString(QStringLiteral("unknown"));
    model->m_updatedAt = json.value(QStringLiteral("updatedAt")).toString();
    model->m_trainingMetrics = json.value(QStringLiteral("trainingMetrics")).toObject();
    model->rebuildIndexes();
    return model;
}

std::unique_ptr<CollaborativeModel> CollaborativeModel::loadFromFile(const QString& path,
                                                                     QString* errorOut)
{
    QFile file(path);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        setErrorText(errorOut, QStringLiteral("cannot open %1").arg(path));
        return nullptr;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setErrorText(errorOut, QStringLiteral("invalid model JSON: %1").arg(parseError.errorString()));
        return nullptr;
    }
    return fromJson(doc.object(), errorOut);
}

QJsonObject CollaborativeModel::toJson() const
{
    QJsonArray hidden;
    for (size_t l = 0; l + 1 < m_layers.size(); ++l) {
        hidden.append(m_layers[l].outputs);
    }

    QJsonArray layers;
    for (const DenseLayer& layer : m_layers) {
        QJsonObject obj;
        obj[QStringLiteral("inputs")] = layer.inputs;
        obj[QStringLiteral("outputs")] = layer.outputs;
        obj[QStringLiteral("weights")] = toJsonArray(layer.weights);
        obj[QStringLiteral("bias")] = toJsonArray(layer.bias);
        layers.append(obj);
    }

    QJsonObject counts;
    for (auto it = m_itemCounts.constBegin(); it != m_itemCounts.constEnd(); ++it) {
        counts[it.key()] = it.value();
    }

    QJsonObject root;
    root[QStringLiteral("formatVersion")] = kFormatVersion;
    root[QStringLiteral("version")] = m_version;
    root[QStringLiteral("updatedAt")] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    root[QStringLiteral("embeddingDim")] = m_embeddingDim;
    root[QStringLiteral("hiddenLayers")] = hidden;
    root[QStringLiteral("userIds")] = QJsonArray::fromStringList(m_userIds);
    root[QStringLiteral("itemIds")] = QJsonArray::fromStringList(m_itemIds);
    root[QStringLiteral("userEmbeddings")] = embeddingTableToJson(m_userEmbeddings, m_userIds.size(), m_embeddingDim);
    root[QStringLiteral("itemEmbeddings")] = embeddingTableToJson(m_itemEmbeddings, m_itemIds.size(), m_embeddingDim);
    root[QStringLiteral("layers")] = layers;
    root[QStringLiteral("itemCounts")] = counts;
    root[QStringLiteral("trainingMetrics")] = m_trainingMetrics;
    return root;
}

bool CollaborativeModel::saveToFile(const QString& path, QString* errorOut) const
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        setErrorText(errorOut, QStringLiteral("cannot create directory for %1").arg(path));
        return false;
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        setErrorText(errorOut, QStringLiteral("cannot write %1").arg(path));
        return false;
    }
    const QByteArray payload = QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
    if (file.write(payload) != payload.size()) {
        file.cancelWriting();
        setErrorText(errorOut, QStringLiteral("short write to %1").arg(path));
        return false;
    }
    if (!file.commit()) {
        setErrorText(errorOut, QStringLiteral("cannot commit %1").arg(path));
        return false;
    }
    return true;
}

double CollaborativeModel::forward(int userIdx, int itemIdx,
                                   std::vector<std::vector<double>>* activations) const
{
    const size_t dim = static_cast<size_t>(m_embeddingDim);
    std::vector<double> input(dim * 2);
    std::copy_n(m_userEmbeddings.begin() + static_cast<long>(userIdx * dim), dim, input.begin());
    std::copy_n(m_itemEmbeddings.begin() + static_cast<long>(itemIdx * dim), dim,
                input.begin() + static_cast<long>(dim));

    double logit = 0.0;
    for (size_t l = 0; l < m_layers.size(); ++l) {
        const DenseLayer& layer = m_layers[l];
        const bool last = l + 1 == m_layers.size();
        std::vector<double> output(static_cast<size_t>(layer.outputs));
        for (int o = 0; o < layer.outputs; ++o) {
            const double* row = layer.weights.data() + static_cast<size_t>(o) * layer.inputs;
            double acc = layer.bias[static_cast<size_t>(o)];
            for (int i = 0; i < layer.inputs; ++i) {
                acc += row[i] * input[static_cast<size_t>(i)];
            }
            output[static_cast<size_t>(o)] = last ? acc : std::max(0.0, acc);
        }
        if (activations) {
            activations->push_back(std::move(input));
        }
        if (last) {
            logit = output.front();
        }
        input = std::move(output);
    }
    return sigmoid(logit);
}

double CollaborativeModel::predict(int userIdx, int itemIdx) const
{
    if (userIdx < 0 || userIdx >= m_userIds.size() || itemIdx < 0 || itemIdx >= m_itemIds.size()) {
        return 0.0;
    }
    const double p = forward(userIdx, itemIdx, nullptr);
    return std::isfinite(p) ? std::clamp(p, 0.0, 1.0) : 0.0;
}

double CollaborativeModel::trainStep(int userIdx, int itemIdx, double label, double learningRate)
{
    std::vector<std::vector<double>> activations;
    activations.reserve(m_layers.size());
    const double p = forward(userIdx, itemIdx, &activations);
    const double clipped = std::clamp(p, kProbabilityEpsilon, 1.0 - kProbabilityEpsilon);
    const double loss = -(label * std::log(clipped) + (1.0 - label) * std::log(1.0 - clipped));

    std::vector<double> delta{p - label};
    for (size_t l = m_layers.size(); l-- > 0;) {
        DenseLayer& layer = m_layers[l];
        const std::vector<double>& in = activations[l];

        std::vector<double> deltaPrev(static_cast<size_t>(layer.inputs), 0.0);
        for (int o = 0; o < layer.outputs; ++o) {
            const double d = delta[static_cast<size_t>(o)];
            double* row = layer.weights.data() + static_cast<size_t>(o) * layer.inputs;
            for (int i = 0; i < layer.inputs; ++i) {
                deltaPrev[static_cast<size_t>(i)] += row[i] * d;
                row[i] -= learningRate * d * in[static_cast<size_t>(i)];
            }
            layer.bias[static_cast<size_t>(o)] -= learningRate * d;
        }
        if (l > 0) {
            for (int i = 0; i < layer.inputs; ++i) {
                if (in[static_cast<size_t>(i)] <= 0.0) {
                    deltaPrev[static_cast<size_t>(i)] = 0.0;
                }
            }
        }
        delta = std::move(deltaPrev);
    }

    const size_t dim = static_cast<size_t>(m_embeddingDim);
    double* user = m_userEmbeddings.data() + static_cast<size_t>(userIdx) * dim;
    double* item = m_itemEmbeddings.data() + static_cast<size_t>(itemIdx) * dim;
    for (size_t d = 0; d < dim; ++d) {
        user[d] -= learningRate * delta[d];
        item[d] -= learningRate * delta[dim + d];
    }
    return loss;
}

} // namespace hr
