#ifndef PIIREDACT_ARCHIVE_REDACTION_ARCHIVE_HPP
#define PIIREDACT_ARCHIVE_REDACTION_ARCHIVE_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace piiredact {
namespace archive {

/**
 * @struct ArchiveRecord
 * @brief One redacted document as it is archived. The original text is never
 *        stored, only its digest.
 */
struct ArchiveRecord
{
    std::string documentName;
    std::string sourceDigest;    ///< sha256 of the original text
    std::string redactedDigest;  ///< sha256 of redactedText
    std::size_t linesRedacted = 0;
    std::size_t entitiesRedacted = 0;
    std::string redactedText;
};

/*
  RedactionArchive
  --------------------------------------------------------
  Keeps redacted output in a SQLite database so a document can be
  re-served without running detection again.

  Table "redactions":
    id, document_name, source_sha256, redacted_sha256,
    lines_redacted, entities_redacted,
    redacted_size, redacted_text (zlib BLOB), created_at

  Each call opens its own connection; a mutex serialises writers from
  the same process (batch workers share one archive).
  Failures are logged and reported through the return value.
*/
class RedactionArchive {
  public:
    explicit RedactionArchive(const std::string& dbPath) : m_dbPath(dbPath) {}

    // Insert one record. Returns false (and logs why) on any SQLite or zlib failure.
    bool Store(const ArchiveRecord& record);

    // Latest redacted text archived for a source digest, if any.
    std::optional<std::string> LoadRedacted(const std::string& sourceDigest) const;

    // Number of archived records, or -1 if the database cannot be read.
    int Count() const;

    const std::string& Path() const { return m_dbPath; }

  private:
    bool openDatabase(sqlite3*& db) const;
    bool initSchema(sqlite3* db) const;
    static bool compressText(const std::string& text, std::vector<unsigned char>& out);
    static bool decompressText(const unsigned char* data, std::size_t size, std::size_t originalSize,
                               std::string& out);

    std::string m_dbPath;
    mutable std::mutex m_mutex;
};

} // namespace archive
} // namespace piiredact

#endif // PIIREDACT_ARCHIVE_REDACTION_ARCHIVE_HPP
