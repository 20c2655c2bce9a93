#pragma once

namespace hr {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x485243;
)";

// Schema v1. Timestamps are REAL Unix epoch seconds (UTC); list columns hold
// compact JSON arrays.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS user_profiles (
    user_id TEXT PRIMARY KEY,
    diversity_preference REAL NOT NULL DEFAULT 0.5
        CHECK (diversity_preference >= 0.0 AND diversity_preference <= 1.0),
    novelty_preference REAL NOT NULL DEFAULT 0.3
        CHECK (novelty_preference >= 0.0 AND novelty_preference <= 1.0),
    recency_bias REAL NOT NULL DEFAULT 0.5
        CHECK (recency_bias >= 0.0 AND recency_bias <= 1.0),
    research_domains TEXT NOT NULL DEFAULT '[]',
    active_domain TEXT,
    excluded_sources TEXT NOT NULL DEFAULT '[]',
    preferred_authors TEXT NOT NULL DEFAULT '[]',
    total_interactions INTEGER NOT NULL DEFAULT 0,
    last_active_at REAL,
    created_at REAL NOT NULL,
    updated_at REAL NOT NULL
);

CREATE TABLE IF NOT EXISTS user_interactions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL,
    resource_id TEXT NOT NULL,
    interaction_type TEXT NOT NULL,
    interaction_strength REAL NOT NULL
        CHECK (interaction_strength >= 0.0 AND interaction_strength <= 1.0),
    is_positive INTEGER NOT NULL DEFAULT 0,
    return_visits INTEGER NOT NULL DEFAULT 0,
    dwell_time REAL,
    scroll_depth REAL,
    rating REAL,
    session_id TEXT,
    confidence REAL NOT NULL DEFAULT 1.0,
    timestamp REAL NOT NULL,
    updated_at REAL NOT NULL,
    UNIQUE(user_id, resource_id)
);

CREATE INDEX IF NOT EXISTS idx_interactions_user_time ON user_interactions(user_id, timestamp DESC);
CREATE INDEX IF NOT EXISTS idx_interactions_user_positive ON user_interactions(user_id, is_positive, timestamp DESC);
CREATE INDEX IF NOT EXISTS idx_interactions_resource ON user_interactions(resource_id);

CREATE TABLE IF NOT EXISTS recommendation_feedback (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL,
    resource_id TEXT NOT NULL,
    strategy TEXT NOT NULL,
    score REAL NOT NULL DEFAULT 0.0,
    rank_position INTEGER NOT NULL DEFAULT 0,
    was_clicked INTEGER NOT NULL DEFAULT 0,
    was_useful INTEGER,
    notes TEXT,
    recommended_at REAL NOT NULL,
    feedback_at REAL
);

CREATE INDEX IF NOT EXISTS idx_feedback_user_time ON recommendation_feedback(user_id, recommended_at DESC);
CREATE INDEX IF NOT EXISTS idx_feedback_user_resource ON recommendation_feedback(user_id, resource_id, recommended_at DESC);
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
INSERT OR IGNORE INTO settings (key, value) VALUES ('created_at', CAST(strftime('%s','now') AS TEXT));
)";

constexpr int kCurrentSchemaVersion = 2;

} // namespace hr
