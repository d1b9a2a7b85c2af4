#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace vmc {

class SQLiteStore;

struct CodingSession {
    double startedAt = 0.0;
    // From the first to the last code of the session; 0 for a single code.
    double durationSeconds = 0.0;
    int codeCount = 0;
};

struct CoderRate {
    int64_t coderId = 0;
    QString coderName;
    std::vector<CodingSession> sessions;

    int totalCodes() const;
    double codesPerHour() const;
};

// CodingRateAnalyzer — how fast each coder works, per sitting.
//
// A coder's codes are split into sessions wherever two consecutive codes
// are more than maxSessionPause apart. Legacy codes are ignored.
class CodingRateAnalyzer {
public:
    explicit CodingRateAnalyzer(SQLiteStore& store);

    std::optional<std::vector<CoderRate>> analyze(std::optional<double> from = std::nullopt,
                                                  std::optional<double> to = std::nullopt,
                                                  int64_t maxSessionPauseSeconds = 600);

    // codes must be grouped by coder and ordered by time within a coder.
    static std::vector<CoderRate> sessionize(const std::vector<CodingRow>& codes,
                                             double maxSessionPauseSeconds);

private:
    SQLiteStore& m_store;
};

} // namespace vmc
