#include "core/store/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <cstdlib>

namespace vmc {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                version = std::atoi(val);
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(vmcStore, "Schema version %d is newer than app version %d — downgrade not supported",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(vmcStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    auto rollback = [&exec]() {
        if (!exec("ROLLBACK;")) {
            LOG_WARN(vmcStore, "Migration rollback failed");
        }
    };

    if (current < 2 && targetVersion >= 2) {
        // Another session may be migrating the same file. Take the write
        // lock first, then re-read the version under it.
        if (!exec("BEGIN IMMEDIATE TRANSACTION;")) {
            return false;
        }

        current = currentSchemaVersion(db);
        if (current >= 2) {
            LOG_INFO(vmcStore, "Schema already at version %d; migration done by another session",
                     current);
            if (!exec("COMMIT;")) {
                rollback();
                return false;
            }
        } else {
            LOG_INFO(vmcStore, "Applying schema migration 1 -> 2");

            // Claim owner and timestamp: lets operators (and the optional lease)
            // find entries a rater claimed but never submitted, and keeps a rater
            // from holding two entries of one utterance.
            if (!exec("ALTER TABLE sample_pool ADD COLUMN claimed_at REAL;")
                || !exec("ALTER TABLE sample_pool ADD COLUMN claimed_by INTEGER REFERENCES coders(id);")
                || !exec("UPDATE sample_pool SET claimed_at = modified_at WHERE is_processing = 1;")
                || !exec("CREATE INDEX IF NOT EXISTS idx_sample_pool_claimed ON sample_pool(is_processing, claimed_at);")
                || !exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');")) {
                rollback();
                return false;
            }

            if (!exec("COMMIT;")) {
                rollback();
                return false;
            }
            current = 2;
        }
    }

    if (current != targetVersion) {
        LOG_ERROR(vmcStore, "Schema migration incomplete: current=%d target=%d",
                  current, targetVersion);
        return false;
    }

    LOG_INFO(vmcStore, "Schema migrations complete: version %d", current);
    return true;
}

} // namespace vmc
