#pragma once

#include "core/shared/errors.h"

#include <QJsonValue>

#include <optional>
#include <vector>

namespace hr {

// Fixed-length, finite float vector. Instances can only be built through the
// validating factories, so code downstream never sees a ragged or NaN vector.
class EmbeddingVector {
public:
    EmbeddingVector() = default;

    static std::optional<EmbeddingVector> fromValues(const std::vector<double>& values,
                                                     int dimensions,
                                                     Error* errorOut = nullptr);
    static std::optional<EmbeddingVector> fromJson(const QJsonValue& json,
                                                   int dimensions,
                                                   Error* errorOut = nullptr);
    static EmbeddingVector zeros(int dimensions);

    int dimensions() const { return static_cast<int>(m_values.size()); }
    bool isEmpty() const { return m_values.empty(); }
    bool isZero() const;
    const std::vector<float>& values() const { return m_values; }
    const float* data() const { return m_values.data(); }

    double norm() const;
    EmbeddingVector normalized() const;

    // Cosine similarity; 0.0 when dimensions differ or either norm is zero.
    static double cosine(const EmbeddingVector& a, const EmbeddingVector& b);

private:
    explicit EmbeddingVector(std::vector<float> values) : m_values(std::move(values)) {}

    std::vector<float> m_values;
};

} // namespace hr
