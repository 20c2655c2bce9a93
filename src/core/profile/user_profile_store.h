#pragma once

#include "core/profile/user_profile.h"
#include "core/shared/errors.h"

#include <QString>
#include <QStringList>
#include <optional>

struct sqlite3;

namespace hr {

class UserProfileStore {
public:
    static constexpr int kMaxListEntryLength = 255;

    explicit UserProfileStore(sqlite3* db);

    // Returns the stored profile, creating it with defaults if absent.
    std::optional<UserProfile> getOrCreateProfile(const QString& userId, Error* errorOut = nullptr);

    // Returns the stored profile without creating one.
    std::optional<UserProfile> getProfile(const QString& userId, Error* errorOut = nullptr) const;

    // Validates the whole update before writing anything. On failure the
    // stored profile is left unchanged and errorOut names the offending field.
    std::optional<UserProfile> updateProfileSettings(const QString& userId,
                                                     const ProfileUpdate& update,
                                                     Error* errorOut = nullptr);

    bool setPreferredAuthors(const QString& userId, const QStringList& authors);

    // Trims each entry and rejects empty, over-long or control-character
    // entries. Duplicates are dropped, first occurrence wins.
    static std::optional<QStringList> sanitizeList(const QStringList& entries,
                                                   bool lowercase,
                                                   const QString& field,
                                                   Error* errorOut = nullptr);

private:
    bool validate(const ProfileUpdate& update, ProfileUpdate* sanitized, Error* errorOut) const;
    bool writeProfile(const UserProfile& profile, Error* errorOut);

    sqlite3* m_db = nullptr;
};

} // namespace hr
