#include "core/embedding/embedding_vector.h"

#include <QJsonArray>

#include <algorithm>
#include <cmath>
#include <limits>

namespace hr {

std::optional<EmbeddingVector> EmbeddingVector::fromValues(const std::vector<double>& values,
                                                           int dimensions,
                                                           Error* errorOut)
{
    if (dimensions <= 0 || static_cast<int>(values.size()) != dimensions) {
        setError(errorOut, ErrorCode::MalformedEmbedding, QStringLiteral("embedding"),
                 QStringLiteral("expected %1 dimensions, got %2")
                     .arg(dimensions)
                     .arg(static_cast<int>(values.size())));
        return std::nullopt;
    }

    std::vector<float> out;
    out.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        const double value = values[i];
        if (!std::isfinite(value) || std::abs(value) > std::numeric_limits<float>::max()) {
            setError(errorOut, ErrorCode::MalformedEmbedding, QStringLiteral("embedding"),
                     QStringLiteral("non-finite value at index %1").arg(static_cast<int>(i)));
            return std::nullopt;
        }
        out.push_back(static_cast<float>(value));
    }
    return EmbeddingVector(std::move(out));
}

std::optional<EmbeddingVector> EmbeddingVector::fromJson(const QJsonValue& json,
                                                         int dimensions,
                                                         Error* errorOut)
{
    if (!json.isArray()) {
        setError(errorOut, ErrorCode::MalformedEmbedding, QStringLiteral("embedding"),
                 QStringLiteral("embedding is not an array"));
        return std::nullopt;
    }

    const QJsonArray array = json.toArray();
    std::vector<double> values;
    values.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        if (!value.isDouble()) {
            setError(errorOut, ErrorCode::MalformedEmbedding, QStringLiteral("embedding"),
                     QStringLiteral("embedding contains a non-numeric value"));
            return std::nullopt;
        }
        values.push_back(value.toDouble());
    }
    return fromValues(values, dimensions, errorOut);
}

EmbeddingVector EmbeddingVector::zeros(int dimensions)
{
    return EmbeddingVector(std::vector<float>(static_cast<size_t>(std::max(dimensions, 0)), 0.0f));
}

bool EmbeddingVector::isZero() const
{
    for (const float value : m_values) {
        if (value != 0.0f) {
            return false;
        }
    }
    return true;
}

double EmbeddingVector::norm() const
{
    double sumSquares = 0.0;
    for (const float value : m_values) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }
    return std::sqrt(sumSquares);
}

EmbeddingVector EmbeddingVector::normalized() const
{
    const double n = norm();
    if (n <= 0.0) {
        return *this;
    }
    std::vector<float> out(m_values);
    for (float& value : out) {
        value = static_cast<float>(static_cast<double>(value) / n);
    }
    return EmbeddingVector(std::move(out));
}

double EmbeddingVector::cosine(const EmbeddingVector& a, const EmbeddingVector& b)
{
    if (a.m_values.empty() || a.m_values.size() != b.m_values.size()) {
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.m_values.size(); ++i) {
        const double x = a.m_values[i];
        const double y = b.m_values[i];
        dot += x * y;
        normA += x * x;
        normB += y * y;
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

} // namespace hr
