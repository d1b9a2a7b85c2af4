#pragma once

#include "core/pool/atomic_claim.h"

struct sqlite3;

namespace vmc {

// Claims through SQLite's database write lock. BEGIN IMMEDIATE is taken
// before the eligibility read, so the read and the compare-and-set update
// happen with no other writer in between.
class SqliteAtomicClaim : public AtomicClaim {
public:
    explicit SqliteAtomicClaim(sqlite3* db, int maxAttempts = 5);

    ClaimOutcome claim(int64_t coderId, double nowSecs) override;

private:
    bool beginImmediate();
    void rollback();

    sqlite3* m_db = nullptr;
    int m_maxAttempts = 5;
};

} // namespace vmc
