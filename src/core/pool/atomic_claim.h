#pragma once

#include "core/shared/types.h"

#include <optional>

namespace vmc {

struct ClaimOutcome {
    enum class Status {
        Claimed,
        NoWork,
        StoreUnavailable,
    };

    Status status = Status::StoreUnavailable;
    std::optional<ClaimedSample> sample;
};

// AtomicClaim — strategy for handing one pool entry to one rater.
//
// Implementations must guarantee that no two concurrent callers, in this or
// any other process, receive the same entry, and that the entry returned
// is not for an utterance the coder has already coded or is holding.
class AtomicClaim {
public:
    virtual ~AtomicClaim() = default;

    // Marks the lowest-id eligible entry as processing for coderId and
    // stamps it with nowSecs.
    virtual ClaimOutcome claim(int64_t coderId, double nowSecs) = 0;
};

} // namespace vmc
