#pragma once

namespace vmc {

// Per-connection pragmas — no write lock required, safe on every open.
// busy_timeout is set high (30 s) so concurrent rater sessions wait out a
// claim transaction held by another connection.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas — require write lock, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x564D43;
PRAGMA user_version = 1;
)";

// Schema v1. Later versions are reached through applyMigrations().
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS participants (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    child_id TEXT NOT NULL UNIQUE,
    sex TEXT NOT NULL,
    date_of_birth TEXT NOT NULL,
    group_name TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS recordings (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    participant_id INTEGER NOT NULL REFERENCES participants(id),
    assessment_id TEXT NOT NULL UNIQUE,
    recording_date TEXT NOT NULL,
    age_in_months REAL NOT NULL,
    start_time REAL NOT NULL,
    is_valid INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS segments (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    recording_id INTEGER NOT NULL REFERENCES recordings(id) ON DELETE CASCADE,
    start_seconds REAL NOT NULL,
    end_seconds REAL NOT NULL,
    activity_count INTEGER NOT NULL DEFAULT 0,
    is_selected INTEGER NOT NULL DEFAULT 0,
    selection_criterion TEXT,
    modified_at REAL NOT NULL,
    CHECK (end_seconds > start_seconds),
    UNIQUE (recording_id, start_seconds, end_seconds)
);

CREATE INDEX IF NOT EXISTS idx_segments_recording ON segments(recording_id);
CREATE INDEX IF NOT EXISTS idx_segments_activity ON segments(recording_id, activity_count DESC, id);

CREATE TABLE IF NOT EXISTS exclusion_durations (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    recording_id INTEGER NOT NULL REFERENCES recordings(id) ON DELETE CASCADE,
    start_time REAL NOT NULL,
    end_time REAL NOT NULL,
    category TEXT NOT NULL,
    CHECK (end_time > start_time),
    UNIQUE (recording_id, start_time, end_time)
);

CREATE INDEX IF NOT EXISTS idx_exclusions_recording ON exclusion_durations(recording_id);

CREATE TABLE IF NOT EXISTS utterances (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    segment_id INTEGER NOT NULL REFERENCES segments(id) ON DELETE CASCADE,
    start_seconds REAL NOT NULL,
    end_seconds REAL NOT NULL,
    duration_seconds REAL NOT NULL,
    audio_file_name TEXT NOT NULL,
    min_pitch REAL NOT NULL DEFAULT 0,
    max_pitch REAL NOT NULL DEFAULT 0,
    average_pitch REAL NOT NULL DEFAULT 0,
    pitch_range REAL NOT NULL DEFAULT 0,
    added_at REAL NOT NULL,
    CHECK (end_seconds > start_seconds),
    UNIQUE (segment_id, start_seconds, end_seconds)
);

CREATE INDEX IF NOT EXISTS idx_utterances_segment ON utterances(segment_id);

CREATE TABLE IF NOT EXISTS coding_batches (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    recording_id INTEGER NOT NULL UNIQUE REFERENCES recordings(id),
    batch_group INTEGER NOT NULL,
    added_at REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_coding_batches_group ON coding_batches(batch_group);

CREATE TABLE IF NOT EXISTS coders (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    first_name TEXT NOT NULL,
    last_name TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS utterance_types (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    description TEXT NOT NULL UNIQUE
);

CREATE TABLE IF NOT EXISTS annotations (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    utterance_type_id INTEGER NOT NULL REFERENCES utterance_types(id),
    description TEXT NOT NULL UNIQUE
);

CREATE TABLE IF NOT EXISTS sample_pool (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    utterance_id INTEGER NOT NULL REFERENCES utterances(id),
    batch_group INTEGER NOT NULL,
    coder_id INTEGER REFERENCES coders(id),
    is_processing INTEGER NOT NULL DEFAULT 0,
    added_at REAL NOT NULL,
    modified_at REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_sample_pool_open ON sample_pool(is_processing, coder_id, id);
CREATE INDEX IF NOT EXISTS idx_sample_pool_group ON sample_pool(batch_group);
CREATE INDEX IF NOT EXISTS idx_sample_pool_utterance ON sample_pool(utterance_id);

CREATE TABLE IF NOT EXISTS utterance_codings (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    utterance_id INTEGER NOT NULL REFERENCES utterances(id),
    coder_id INTEGER NOT NULL REFERENCES coders(id),
    annotation_id INTEGER NOT NULL REFERENCES annotations(id),
    total_syllable_count INTEGER NOT NULL DEFAULT 0,
    canonical_syllable_count INTEGER NOT NULL DEFAULT 0,
    non_canonical_syllable_count INTEGER NOT NULL DEFAULT 0,
    word_syllable_count INTEGER NOT NULL DEFAULT 0,
    word_count INTEGER NOT NULL DEFAULT 0,
    comments TEXT,
    is_acceptable INTEGER NOT NULL DEFAULT 1,
    added_at REAL NOT NULL,
    modified_at REAL NOT NULL,
    UNIQUE (utterance_id, coder_id)
);

CREATE INDEX IF NOT EXISTS idx_codings_coder ON utterance_codings(coder_id, added_at);
)";

// Lookup values every database starts with.
constexpr const char* kDefaultLookups = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
INSERT OR IGNORE INTO utterance_types (id, description) VALUES (1, 'Speech');
INSERT OR IGNORE INTO utterance_types (id, description) VALUES (2, 'Non-Speech');
INSERT OR IGNORE INTO annotations (utterance_type_id, description) VALUES (1, 'Canonical');
INSERT OR IGNORE INTO annotations (utterance_type_id, description) VALUES (1, 'Non-Canonical');
INSERT OR IGNORE INTO annotations (utterance_type_id, description) VALUES (1, 'Word');
INSERT OR IGNORE INTO annotations (utterance_type_id, description) VALUES (2, 'Crying');
INSERT OR IGNORE INTO annotations (utterance_type_id, description) VALUES (2, 'Laughing');
INSERT OR IGNORE INTO annotations (utterance_type_id, description) VALUES (2, 'Vegetative');
INSERT OR IGNORE INTO annotations (utterance_type_id, description) VALUES (2, 'Other');
)";

// Comment marking codes imported from the pre-pool coding process.
constexpr const char* kLegacyCodeComment = "Legacy Code";

constexpr int kCurrentSchemaVersion = 2;

} // namespace vmc
