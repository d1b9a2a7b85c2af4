#pragma once

#include <QString>
#include <cstdint>

namespace vmc {

struct Settings {
    // Database
    QString dbPath;

    // Segment selection
    int highVolubilityCount = 10;
    int randomCount = 20;

    // Sample pool
    int coderCount = 3;
    // 0 disables claim expiry; a claim is then held until submit() or an
    // administrative release.
    int64_t claimLeaseSeconds = 0;

    // Consensus
    QString referenceCategory = QStringLiteral("Speech");

    // Coding rate report
    int64_t maxSessionPauseSeconds = 600;
};

} // namespace vmc
