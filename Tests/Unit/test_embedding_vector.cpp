#include <QtTest/QtTest>

#include "core/embedding/embedding_vector.h"

#include <QJsonArray>

#include <cmath>
#include <limits>

class TestEmbeddingVector : public QObject {
    Q_OBJECT

private slots:
    void testFromValuesAcceptsMatchingDimensions();
    void testDimensionMismatchRejected();
    void testNonFiniteValuesRejected();
    void testFromJsonRequiresNumericArray();
    void testZeros();
    void testNormalized();
    void testCosine();
    void testCosineDegenerateInputs();
};

void TestEmbeddingVector::testFromValuesAcceptsMatchingDimensions()
{
    hr::Error error;
    const auto vec = hr::EmbeddingVector::fromValues({1.0, 2.0, 2.0}, 3, &error);
    QVERIFY(vec.has_value());
    QCOMPARE(vec->dimensions(), 3);
    QVERIFY(!vec->isZero());
    QVERIFY(qFuzzyCompare(vec->norm(), 3.0));
}

void TestEmbeddingVector::testDimensionMismatchRejected()
{
    hr::Error error;
    QVERIFY(!hr::EmbeddingVector::fromValues({1.0, 2.0}, 3, &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::MalformedEmbedding);
    QVERIFY(error.message.contains(QStringLiteral("3")));

    QVERIFY(!hr::EmbeddingVector::fromValues({}, 0).has_value());
}

void TestEmbeddingVector::testNonFiniteValuesRejected()
{
    hr::Error error;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    QVERIFY(!hr::EmbeddingVector::fromValues({0.1, nan, 0.3}, 3, &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::MalformedEmbedding);
    QVERIFY(error.message.contains(QStringLiteral("index 1")));

    const double inf = std::numeric_limits<double>::infinity();
    QVERIFY(!hr::EmbeddingVector::fromValues({inf, 0.0}, 2).has_value());
}

void TestEmbeddingVector::testFromJsonRequiresNumericArray()
{
    hr::Error error;
    QVERIFY(!hr::EmbeddingVector::fromJson(QJsonValue(QStringLiteral("0.1,0.2")), 2, &error));
    QCOMPARE(error.code, hr::ErrorCode::MalformedEmbedding);

    error = hr::Error{};
    QVERIFY(!hr::EmbeddingVector::fromJson(
        QJsonArray{0.1, QStringLiteral("x")}, 2, &error));
    QCOMPARE(error.code, hr::ErrorCode::MalformedEmbedding);

    const auto vec = hr::EmbeddingVector::fromJson(QJsonArray{0.5, -0.5}, 2);
    QVERIFY(vec.has_value());
    QCOMPARE(vec->values().at(0), 0.5f);
    QCOMPARE(vec->values().at(1), -0.5f);
}

void TestEmbeddingVector::testZeros()
{
    const hr::EmbeddingVector zero = hr::EmbeddingVector::zeros(8);
    QCOMPARE(zero.dimensions(), 8);
    QVERIFY(zero.isZero());
    QCOMPARE(zero.norm(), 0.0);
    QCOMPARE(zero.normalized().dimensions(), 8);
    QVERIFY(zero.normalized().isZero());

    QVERIFY(hr::EmbeddingVector::zeros(-1).isEmpty());
}

void TestEmbeddingVector::testNormalized()
{
    const auto vec = hr::EmbeddingVector::fromValues({3.0, 4.0}, 2);
    QVERIFY(vec.has_value());
    const hr::EmbeddingVector unit = vec->normalized();
    QVERIFY(std::abs(unit.norm() - 1.0) < 1e-6);
    QVERIFY(std::abs(unit.values().at(0) - 0.6f) < 1e-6f);
}

void TestEmbeddingVector::testCosine()
{
    const auto a = hr::EmbeddingVector::fromValues({1.0, 0.0, 0.0}, 3);
    const auto b = hr::EmbeddingVector::fromValues({0.0, 1.0, 0.0}, 3);
    const auto c = hr::EmbeddingVector::fromValues({2.0, 0.0, 0.0}, 3);
    const auto d = hr::EmbeddingVector::fromValues({-1.0, 0.0, 0.0}, 3);
    QVERIFY(a && b && c && d);

    QCOMPARE(hr::EmbeddingVector::cosine(*a, *b), 0.0);
    QVERIFY(qFuzzyCompare(hr::EmbeddingVector::cosine(*a, *c), 1.0));
    QVERIFY(qFuzzyCompare(hr::EmbeddingVector::cosine(*a, *d), -1.0));
}

void TestEmbeddingVector::testCosineDegenerateInputs()
{
    const auto a = hr::EmbeddingVector::fromValues({1.0, 0.0, 0.0}, 3);
    const auto shorter = hr::EmbeddingVector::fromValues({1.0, 0.0}, 2);
    QVERIFY(a && shorter);

    QCOMPARE(hr::EmbeddingVector::cosine(*a, *shorter), 0.0);
    QCOMPARE(hr::EmbeddingVector::cosine(*a, hr::EmbeddingVector::zeros(3)), 0.0);
    QCOMPARE(hr::EmbeddingVector::cosine(hr::EmbeddingVector(), hr::EmbeddingVector()), 0.0);
}

QTEST_MAIN(TestEmbeddingVector)
#include "test_embedding_vector.moc"
