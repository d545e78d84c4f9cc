#include "archive/redaction_archive.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include <utility>
#include <zlib.h>

namespace piiredact {
namespace archive {

bool RedactionArchive::Store(const ArchiveRecord& record) {
    using namespace piiredact::util::logger;
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3* db = nullptr;
    if (!openDatabase(db)) {
        error("[RedactionArchive] Could not open database: " + m_dbPath);
        return false;
    }
    if (!initSchema(db)) {
        sqlite3_close(db);
        return false;
    }

    std::vector<unsigned char> compressed;
    if (!compressText(record.redactedText, compressed)) {
        error("[RedactionArchive] zlib compression failed for " + record.documentName);
        sqlite3_close(db);
        return false;
    }

    const char* sql = "INSERT INTO redactions (document_name, source_sha256, redacted_sha256,"
                      " lines_redacted, entities_redacted, redacted_size, redacted_text)"
                      " VALUES (?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
        error("[RedactionArchive] prepare failed: " + std::string(sqlite3_errmsg(db)));
        sqlite3_close(db);
        return false;
    }

    bool bound = sqlite3_bind_text(stmt, 1, record.documentName.c_str(), -1, SQLITE_STATIC) == SQLITE_OK
        && sqlite3_bind_text(stmt, 2, record.sourceDigest.c_str(), -1, SQLITE_STATIC) == SQLITE_OK
        && sqlite3_bind_text(stmt, 3, record.redactedDigest.c_str(), -1, SQLITE_STATIC) == SQLITE_OK
        && sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(record.linesRedacted)) == SQLITE_OK
        && sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(record.entitiesRedacted)) == SQLITE_OK
        && sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(record.redactedText.size())) == SQLITE_OK
        && sqlite3_bind_blob(stmt, 7, compressed.data(), static_cast<int>(compressed.size()),
                             SQLITE_STATIC) == SQLITE_OK;
    if (!bound) {
        error("[RedactionArchive] bind failed: " + std::string(sqlite3_errmsg(db)));
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return false;
    }

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        error("[RedactionArchive] insert failed: " + std::string(sqlite3_errmsg(db)));
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    if (rc != SQLITE_DONE) {
        return false;
    }

    info("[RedactionArchive] Archived " + record.documentName + " source="
         + util::hashing::shortDigest(record.sourceDigest) + " redacted="
         + util::hashing::shortDigest(record.redactedDigest));
    return true;
}

std::optional<std::string> RedactionArchive::LoadRedacted(const std::string& sourceDigest) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3* db = nullptr;
    if (sqlite3_open_v2(m_dbPath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return std::nullopt;
    }
    const char* sql = "SELECT redacted_size, redacted_text FROM redactions"
                      " WHERE source_sha256 = ? ORDER BY id DESC LIMIT 1;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, sourceDigest.c_str(), -1, SQLITE_STATIC);

    std::optional<std::string> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        std::size_t originalSize = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
        const unsigned char* blob = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, 1));
        int blobSize = sqlite3_column_bytes(stmt, 1);
        std::string text;
        if (decompressText(blob, static_cast<std::size_t>(blobSize), originalSize, text)) {
            result = std::move(text);
        } else {
            util::logger::error("[RedactionArchive] corrupt archive entry for source "
                                + util::hashing::shortDigest(sourceDigest));
        }
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return result;
}

int RedactionArchive::Count() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3* db = nullptr;
    if (sqlite3_open_v2(m_dbPath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return -1;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM redactions", -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return -1;
    }
    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return count;
}

bool RedactionArchive::openDatabase(sqlite3*& db) const {
    int rc = sqlite3_open(m_dbPath.c_str(), &db);
    if (rc != SQLITE_OK || db == nullptr) {
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    sqlite3_busy_timeout(db, 5000);
    return true;
}

bool RedactionArchive::initSchema(sqlite3* db) const {
    const char* ddl = "CREATE TABLE IF NOT EXISTS redactions ("
                      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                      " document_name TEXT,"
                      " source_sha256 TEXT NOT NULL,"
                      " redacted_sha256 TEXT NOT NULL,"
                      " lines_redacted INTEGER,"
                      " entities_redacted INTEGER,"
                      " redacted_size INTEGER NOT NULL,"
                      " redacted_text BLOB,"
                      " created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                      ");"
                      "CREATE INDEX IF NOT EXISTS idx_redactions_source ON redactions (source_sha256);";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, ddl, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        util::logger::error("[RedactionArchive] initSchema error: "
                            + std::string(errMsg ? errMsg : sqlite3_errmsg(db)));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool RedactionArchive::compressText(const std::string& text, std::vector<unsigned char>& out) {
    uLongf outSize = compressBound(static_cast<uLong>(text.size()));
    out.resize(outSize);
    if (compress2(out.data(), &outSize, reinterpret_cast<const Bytef*>(text.data()),
                  static_cast<uLong>(text.size()), Z_BEST_COMPRESSION) != Z_OK) {
        return false;
    }
    out.resize(outSize);
    return true;
}

bool RedactionArchive::decompressText(const unsigned char* data, std::size_t size,
                                      std::size_t originalSize, std::string& out) {
    if (originalSize == 0) {
        out.clear();
        return true;
    }
    if (data == nullptr || size == 0) {
        return false;
    }
    std::vector<unsigned char> buffer(originalSize);
    uLongf outSize = static_cast<uLongf>(originalSize);
    if (uncompress(buffer.data(), &outSize, data, static_cast<uLong>(size)) != Z_OK
        || outSize != originalSize) {
        return false;
    }
    out.assign(buffer.begin(), buffer.end());
    return true;
}

} // namespace archive
} // namespace piiredact
