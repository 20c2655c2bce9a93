#include <QtTest/QtTest>

#include "core/profile/user_profile_store.h"
#include "core/store/sqlite_store.h"

class TestUserProfileStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testCreateWithDefaults();
    void testGetOrCreateIsIdempotent();
    void testGetProfileMissingIsNotFound();
    void testEmptyUserIdRejected();
    void testPartialUpdateKeepsOtherFields();
    void testOutOfRangePreferenceLeavesProfileUnchanged();
    void testListsAreSanitized();
    void testControlCharacterRejected();
    void testRankingWeightsSetAndClear();
    void testRankingWeightsMustSumToOne();
    void testPreferredAuthorsPersist();

private:
    std::optional<hr::SQLiteStore> m_store;
};

void TestUserProfileStore::init()
{
    m_store = hr::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store.has_value());
}

void TestUserProfileStore::cleanup()
{
    m_store.reset();
}

void TestUserProfileStore::testCreateWithDefaults()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    const auto profile = profiles.getOrCreateProfile(QStringLiteral("alice"));
    QVERIFY(profile.has_value());
    QCOMPARE(profile->userId, QStringLiteral("alice"));
    QCOMPARE(profile->diversityPreference, 0.5);
    QCOMPARE(profile->noveltyPreference, 0.3);
    QCOMPARE(profile->recencyBias, 0.5);
    QVERIFY(profile->excludedSources.isEmpty());
    QVERIFY(!profile->rankingWeights.has_value());
    QCOMPARE(profile->totalInteractions, 0);
    QVERIFY(profile->createdAt > 0.0);
}

void TestUserProfileStore::testGetOrCreateIsIdempotent()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    const auto first = profiles.getOrCreateProfile(QStringLiteral("alice"));
    const auto second = profiles.getOrCreateProfile(QStringLiteral("alice"));
    QVERIFY(first.has_value() && second.has_value());
    QCOMPARE(first->createdAt, second->createdAt);
}

void TestUserProfileStore::testGetProfileMissingIsNotFound()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    hr::Error error;
    QVERIFY(!profiles.getProfile(QStringLiteral("ghost"), &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::NotFound);
}

void TestUserProfileStore::testEmptyUserIdRejected()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    hr::Error error;
    QVERIFY(!profiles.getOrCreateProfile(QStringLiteral("   "), &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::InvalidRequest);
    QCOMPARE(error.field, QStringLiteral("userId"));
}

void TestUserProfileStore::testPartialUpdateKeepsOtherFields()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    hr::ProfileUpdate update;
    update.noveltyPreference = 0.9;
    const auto updated = profiles.updateProfileSettings(QStringLiteral("alice"), update);
    QVERIFY(updated.has_value());
    QCOMPARE(updated->noveltyPreference, 0.9);
    QCOMPARE(updated->diversityPreference, 0.5);

    const auto reloaded = profiles.getProfile(QStringLiteral("alice"));
    QVERIFY(reloaded.has_value());
    QCOMPARE(reloaded->noveltyPreference, 0.9);
    QCOMPARE(reloaded->recencyBias, 0.5);
}

void TestUserProfileStore::testOutOfRangePreferenceLeavesProfileUnchanged()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    QVERIFY(profiles.getOrCreateProfile(QStringLiteral("alice")).has_value());

    hr::ProfileUpdate update;
    update.noveltyPreference = 0.8;
    update.diversityPreference = 1.5;
    hr::Error error;
    QVERIFY(!profiles.updateProfileSettings(QStringLiteral("alice"), update, &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::InvalidPreferenceRange);
    QCOMPARE(error.field, QStringLiteral("diversityPreference"));

    const auto stored = profiles.getProfile(QStringLiteral("alice"));
    QVERIFY(stored.has_value());
    QCOMPARE(stored->noveltyPreference, 0.3);
    QCOMPARE(stored->diversityPreference, 0.5);
}

void TestUserProfileStore::testListsAreSanitized()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    hr::ProfileUpdate update;
    update.excludedSources = QStringList{QStringLiteral("  ArXiv "), QStringLiteral("arxiv"),
                                         QStringLiteral("PubMed")};
    update.researchDomains = QStringList{QStringLiteral(" Physics"), QStringLiteral("Biology")};
    const auto updated = profiles.updateProfileSettings(QStringLiteral("alice"), update);
    QVERIFY(updated.has_value());
    QCOMPARE(updated->excludedSources, (QStringList{QStringLiteral("arxiv"), QStringLiteral("pubmed")}));
    QCOMPARE(updated->researchDomains, (QStringList{QStringLiteral("Physics"), QStringLiteral("Biology")}));

    hr::ProfileUpdate bad;
    bad.excludedSources = QStringList{QStringLiteral("ok"), QStringLiteral("   ")};
    hr::Error error;
    QVERIFY(!profiles.updateProfileSettings(QStringLiteral("alice"), bad, &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::InvalidInputList);
    QCOMPARE(error.field, QStringLiteral("excludedSources"));

    hr::ProfileUpdate tooLong;
    tooLong.researchDomains = QStringList{QString(hr::UserProfileStore::kMaxListEntryLength + 1, QLatin1Char('x'))};
    QVERIFY(!profiles.updateProfileSettings(QStringLiteral("alice"), tooLong, &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::InvalidInputList);
}

void TestUserProfileStore::testControlCharacterRejected()
{
    hr::Error error;
    const auto cleaned = hr::UserProfileStore::sanitizeList(
        {QStringLiteral("fine"), QStringLiteral("bad\x01value")}, false, QStringLiteral("researchDomains"),
        &error);
    QVERIFY(!cleaned.has_value());
    QCOMPARE(error.code, hr::ErrorCode::InvalidInputList);
    QVERIFY(error.message.contains(QStringLiteral("entry 1")));
}

void TestUserProfileStore::testRankingWeightsSetAndClear()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    hr::HybridWeights weights;
    weights.collaborative = 0.1;
    weights.content = 0.5;
    weights.graph = 0.2;
    weights.quality = 0.1;
    weights.recency = 0.1;

    hr::ProfileUpdate update;
    update.rankingWeights = weights;
    QVERIFY(profiles.updateProfileSettings(QStringLiteral("alice"), update).has_value());

    auto stored = profiles.getProfile(QStringLiteral("alice"));
    QVERIFY(stored.has_value() && stored->rankingWeights.has_value());
    QCOMPARE(stored->rankingWeights->content, 0.5);

    hr::ProfileUpdate clear;
    clear.clearRankingWeights = true;
    QVERIFY(profiles.updateProfileSettings(QStringLiteral("alice"), clear).has_value());
    stored = profiles.getProfile(QStringLiteral("alice"));
    QVERIFY(stored.has_value());
    QVERIFY(!stored->rankingWeights.has_value());
}

void TestUserProfileStore::testRankingWeightsMustSumToOne()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    hr::HybridWeights weights;
    weights.collaborative = 0.9;

    hr::ProfileUpdate update;
    update.rankingWeights = weights;
    hr::Error error;
    QVERIFY(!profiles.updateProfileSettings(QStringLiteral("alice"), update, &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::InvalidWeights);

    QVERIFY(!hr::HybridWeights::fromJson(QJsonObject{{QStringLiteral("content"), 1.0}}, &error).has_value());
    QCOMPARE(error.code, hr::ErrorCode::InvalidWeights);
}

void TestUserProfileStore::testPreferredAuthorsPersist()
{
    hr::UserProfileStore profiles(m_store->rawDb());
    QVERIFY(profiles.getOrCreateProfile(QStringLiteral("alice")).has_value());
    QVERIFY(profiles.setPreferredAuthors(QStringLiteral("alice"),
                                         {QStringLiteral("Noether"), QStringLiteral("Curie")}));
    const auto stored = profiles.getProfile(QStringLiteral("alice"));
    QVERIFY(stored.has_value());
    QCOMPARE(stored->preferredAuthors, (QStringList{QStringLiteral("Noether"), QStringLiteral("Curie")}));
}

QTEST_MAIN(TestUserProfileStore)
#include "test_user_profile_store.moc"
