#pragma once

#include <imgpipe/core/records.hpp>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace imgpipe::ledger {

/// SQL failure while the ledger is in use (500-class; callers should not retry blindly).
class LedgerException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Content record columns written back by processing jobs.
enum class ContentField {
  ExifJson,
  Caption,
};

/// Result of get_or_create_content_record.
struct ContentInsert {
  core::ContentRecord record;
  bool was_new{false};
};

/// SQLite-backed metadata ledger: content records keyed by SHA-256, upload
/// attempts keyed by attempt id, and one processing outcome per attempt.
///
/// Thread safety: one connection per Ledger, every call serialised by an
/// internal mutex. Several Ledger instances (or processes) may share a
/// database file; write transactions use BEGIN IMMEDIATE and a busy timeout.
class Ledger {
 public:
  /// Opens (creating if needed) the database and its schema.
  /// Throws std::runtime_error if the file cannot be opened.
  explicit Ledger(const std::string& db_path);
  ~Ledger();

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;

  /// Atomic insert-if-absent on content_hash. Exactly one caller per hash
  /// ever sees was_new = true; the others get the stored record.
  [[nodiscard]] ContentInsert get_or_create_content_record(const std::string& content_hash,
                                                           const core::ContentDescriptor& descriptor,
                                                           core::TimePoint now);

  /// Inserts an attempt and its outcome in one transaction.
  void record_upload_attempt(const core::UploadAttempt& attempt,
                             const core::ProcessingOutcome& outcome);

  /// Moves a pending outcome to a terminal status. Returns false if the
  /// attempt is unknown or already terminal.
  bool record_outcome(const std::string& attempt_id, core::OutcomeStatus status, core::TimePoint end);

  /// Sets one job-owned column. Returns false if the hash is unknown.
  bool update_content_field(const std::string& content_hash, ContentField field, const std::string& value);

  /// Settles every pending outcome whose attempt links to content_hash and
  /// records the status on the content record, in one transaction. A hash
  /// already settled as success keeps that status.
  /// Returns the number of outcomes settled.
  std::size_t settle_pending_outcomes(const std::string& content_hash,
                                      core::OutcomeStatus status,
                                      core::TimePoint end);

  /// Caption write plus success settlement of pending outcomes, in one transaction.
  /// Returns false (and changes nothing) if the hash is unknown.
  bool complete_caption(const std::string& content_hash, const std::string& caption, core::TimePoint end);

  /// Puts a failed caption stage back to pending before it is re-run.
  /// Returns false if the hash is unknown or not in the failed state.
  bool reopen_caption(const std::string& content_hash);

  [[nodiscard]] std::optional<core::ContentRecord> find_content_record(const std::string& content_hash);
  [[nodiscard]] std::optional<core::UploadView> find_upload(const std::string& attempt_id);
  /// All attempts, most recently processed first.
  [[nodiscard]] std::vector<core::UploadView> list_uploads();
  [[nodiscard]] std::optional<core::ProcessingOutcome> find_outcome(const std::string& attempt_id);
  [[nodiscard]] std::vector<core::ProcessingOutcome> list_outcomes();
  /// Stored path of the oldest attempt referencing content_hash.
  [[nodiscard]] std::optional<std::string> find_stored_path(const std::string& content_hash);
  [[nodiscard]] std::size_t count_content_records();
  [[nodiscard]] std::size_t count_upload_attempts();

 private:
  [[nodiscard]] std::optional<core::ContentRecord> find_content_record_locked(const std::string& content_hash);
  std::size_t settle_pending_locked(const std::string& content_hash,
                                    core::OutcomeStatus status,
                                    core::TimePoint end);

  sqlite3* db_{nullptr};
  std::mutex mutex_;
};

}  // namespace imgpipe::ledger
