#pragma once

#include <QString>
#include <cstdint>
#include <optional>

namespace vmc {

// Why a segment entered the rating pipeline. Persisted as a two-letter
// symbol in segments.selection_criterion.
enum class SelectionCriterion {
    None,
    HighVolubility,
    RandomSample,
};

QString selectionCriterionToSymbol(SelectionCriterion criterion);
QString selectionCriterionToString(SelectionCriterion criterion);
SelectionCriterion selectionCriterionFromSymbol(const QString& symbol);

enum class ExclusionCategory {
    Nap,
    Scrub,
};

QString exclusionCategoryToString(ExclusionCategory category);
std::optional<ExclusionCategory> exclusionCategoryFromString(const QString& str);

// Half-open time interval [start, end), in seconds.
struct TimeWindow {
    double start = 0.0;
    double end = 0.0;
};

struct Segment {
    int64_t id = 0;
    int64_t recordingId = 0;
    // Relative to the recording start.
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    // Child vocalization count; the activity metric used for ranking.
    int activityCount = 0;
    bool isSelected = false;
    SelectionCriterion criterion = SelectionCriterion::None;
};

// Absolute (epoch seconds) window during which the recording must not be
// sampled.
struct ExclusionWindow {
    int64_t id = 0;
    int64_t recordingId = 0;
    double startTime = 0.0;
    double endTime = 0.0;
    ExclusionCategory category = ExclusionCategory::Nap;
};

// A vocal event attributed to the target speaker, as reported by the
// recording's ITS data. Pitch statistics are computed upstream.
struct VocalEvent {
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    double minPitch = 0.0;
    double maxPitch = 0.0;
    double averagePitch = 0.0;
};

struct Utterance {
    int64_t id = 0;
    int64_t segmentId = 0;
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    double durationSeconds = 0.0;
    QString audioFileName;
    double minPitch = 0.0;
    double maxPitch = 0.0;
    double averagePitch = 0.0;
    double pitchRange = 0.0;
};

struct PoolEntry {
    int64_t id = 0;
    int64_t utteranceId = 0;
    int batchGroup = 0;
    std::optional<int64_t> coderId;
    bool isProcessing = false;
    // Set while processing; cleared on submit or release.
    std::optional<int64_t> claimedBy;
    std::optional<double> claimedAt;
};

// What a rater receives from claimNext(): the pool slot to submit against
// and a reference to the utterance payload.
struct ClaimedSample {
    int64_t poolEntryId = 0;
    int64_t utteranceId = 0;
    double durationSeconds = 0.0;
    QString audioFileName;
};

// One rater's judgment on one utterance.
struct UtteranceCode {
    // Set when the rater revises a code they already saved in this session.
    std::optional<int64_t> codingId;
    int64_t utteranceId = 0;
    int64_t coderId = 0;
    QString annotation;
    int totalSyllableCount = 0;
    int canonicalSyllableCount = 0;
    int wordSyllableCount = 0;
    int wordCount = 0;
    QString comments;

    int nonCanonicalSyllableCount() const
    {
        return totalSyllableCount - canonicalSyllableCount;
    }
};

// A persisted coding joined with its coder and utterance-type lookups.
struct CodingRow {
    int64_t codingId = 0;
    int64_t utteranceId = 0;
    int64_t coderId = 0;
    QString coderName;
    int totalSyllableCount = 0;
    int canonicalSyllableCount = 0;
    int nonCanonicalSyllableCount = 0;
    int wordSyllableCount = 0;
    int wordCount = 0;
    // Utterance type description ("Speech", "Non-Speech"); the category
    // that scoped averages filter on.
    QString utteranceType;
    QString annotation;
    QString comments;
    bool isAcceptable = true;
    double addedAt = 0.0;
};

// Recording, participant, segment and acoustic metadata for one utterance.
struct UtteranceMetadata {
    int64_t utteranceId = 0;
    QString assessmentId;
    QString recordingDate;
    QString childId;
    QString childSex;
    QString childDateOfBirth;
    double ageInMonths = 0.0;
    QString childGroup;
    int64_t segmentId = 0;
    SelectionCriterion selectionCriterion = SelectionCriterion::None;
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    double durationSeconds = 0.0;
    double minPitch = 0.0;
    double maxPitch = 0.0;
    double averagePitch = 0.0;
    double pitchRange = 0.0;
};

} // namespace vmc
