#include <imgpipe/ledger/ledger.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <cstdint>

namespace imgpipe::ledger {

using core::ContentRecord;
using core::OutcomeStatus;
using core::ProcessingOutcome;
using core::TimePoint;
using core::UploadAttempt;
using core::UploadView;

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kSchema = R"SQL(
  CREATE TABLE IF NOT EXISTS content_records (
    sha256         TEXT PRIMARY KEY,
    width          INTEGER NOT NULL,
    height         INTEGER NOT NULL,
    format         TEXT NOT NULL,
    size_bytes     INTEGER NOT NULL,
    first_seen_ms  INTEGER NOT NULL,
    exif_json      TEXT,
    caption        TEXT,
    caption_status INTEGER NOT NULL DEFAULT 0
  );
  CREATE TABLE IF NOT EXISTS upload_attempts (
    attempt_id      TEXT PRIMARY KEY,
    original_name   TEXT NOT NULL,
    processed_at_ms INTEGER NOT NULL,
    stored_path     TEXT,
    content_sha256  TEXT REFERENCES content_records(sha256),
    error           TEXT
  );
  CREATE INDEX IF NOT EXISTS idx_upload_attempts_sha256 ON upload_attempts(content_sha256);
  CREATE TABLE IF NOT EXISTS processing_outcomes (
    attempt_id TEXT PRIMARY KEY REFERENCES upload_attempts(attempt_id),
    start_ms   INTEGER NOT NULL,
    end_ms     INTEGER,
    status     INTEGER NOT NULL
  );
)SQL";

// Column lists shared by the content record readers.
constexpr const char* kContentColumns =
    "c.sha256, c.width, c.height, c.format, c.size_bytes, c.first_seen_ms, c.exif_json, c.caption, "
    "c.caption_status";

constexpr const char* kAttemptColumns =
    "a.attempt_id, a.original_name, a.processed_at_ms, a.stored_path, a.content_sha256, a.error";
constexpr int kAttemptColumnCount = 6;

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw LedgerException("ledger: " + msg);
  }
}

/// Prepared statement, finalized on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      throw LedgerException(std::string("ledger: prepare failed: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int i, const std::string& v) {
    check(sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT));
  }
  void bind(int i, std::int64_t v) { check(sqlite3_bind_int64(st_, i, v)); }
  void bind(int i, const std::optional<std::string>& v) {
    if (v) {
      bind(i, *v);
    } else {
      check(sqlite3_bind_null(st_, i));
    }
  }
  void bind(int i, const std::optional<TimePoint>& v) {
    if (v) {
      bind(i, core::to_epoch_ms(*v));
    } else {
      check(sqlite3_bind_null(st_, i));
    }
  }

  /// True while rows are produced; false once done.
  bool step() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw LedgerException(std::string("ledger: step failed: ") + sqlite3_errmsg(db_));
  }

  void run() {
    if (step()) {
      throw LedgerException("ledger: statement unexpectedly returned rows");
    }
  }

  [[nodiscard]] bool is_null(int col) const { return sqlite3_column_type(st_, col) == SQLITE_NULL; }
  [[nodiscard]] std::int64_t int64(int col) const { return sqlite3_column_int64(st_, col); }
  [[nodiscard]] std::string text(int col) const {
    const auto* p = sqlite3_column_text(st_, col);
    if (!p) return {};
    return std::string(reinterpret_cast<const char*>(p),
                       static_cast<std::size_t>(sqlite3_column_bytes(st_, col)));
  }
  [[nodiscard]] std::optional<std::string> optional_text(int col) const {
    if (is_null(col)) return std::nullopt;
    return text(col);
  }

 private:
  void check(int rc) {
    if (rc != SQLITE_OK) {
      throw LedgerException(std::string("ledger: bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  sqlite3* db_;
  sqlite3_stmt* st_{nullptr};
};

/// BEGIN IMMEDIATE on construction; rolls back unless commit() was called.
class Transaction {
 public:
  explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE"); }
  ~Transaction() {
    if (!committed_ && sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
      spdlog::error("ledger_rollback_failed error={}", sqlite3_errmsg(db_));
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    exec(db_, "COMMIT");
    committed_ = true;
  }

 private:
  sqlite3* db_;
  bool committed_{false};
};

bool has_column(sqlite3* db, const char* table, const char* column) {
  Statement st(db, std::string("PRAGMA table_info(") + table + ")");
  while (st.step()) {
    if (st.text(1) == column) return true;
  }
  return false;
}

/// Databases created before caption_status existed: add it and mark
/// captioned content as settled.
void migrate_caption_status(sqlite3* db) {
  if (has_column(db, "content_records", "caption_status")) return;
  Transaction tx(db);
  exec(db, "ALTER TABLE content_records ADD COLUMN caption_status INTEGER NOT NULL DEFAULT 0");
  exec(db, "UPDATE content_records SET caption_status = 1 WHERE caption IS NOT NULL");
  tx.commit();
}

ContentRecord read_content(const Statement& st, int off) {
  ContentRecord r;
  r.content_hash = st.text(off + 0);
  r.width = static_cast<std::uint32_t>(st.int64(off + 1));
  r.height = static_cast<std::uint32_t>(st.int64(off + 2));
  r.format = st.text(off + 3);
  r.size_bytes = static_cast<std::uint64_t>(st.int64(off + 4));
  r.first_seen = core::from_epoch_ms(st.int64(off + 5));
  r.exif_json = st.optional_text(off + 6);
  r.caption = st.optional_text(off + 7);
  r.caption_status = static_cast<OutcomeStatus>(st.int64(off + 8));
  return r;
}

UploadAttempt read_attempt(const Statement& st, int off) {
  UploadAttempt a;
  a.attempt_id = st.text(off + 0);
  a.original_name = st.text(off + 1);
  a.processed_at = core::from_epoch_ms(st.int64(off + 2));
  a.stored_path = st.optional_text(off + 3);
  a.content_hash = st.optional_text(off + 4);
  a.error = st.optional_text(off + 5);
  return a;
}

UploadView read_view(const Statement& st) {
  UploadView v;
  v.attempt = read_attempt(st, 0);
  if (!st.is_null(kAttemptColumnCount)) {
    v.content = read_content(st, kAttemptColumnCount);
  }
  return v;
}

ProcessingOutcome read_outcome(const Statement& st) {
  ProcessingOutcome o;
  o.attempt_id = st.text(0);
  o.start_time = core::from_epoch_ms(st.int64(1));
  if (!st.is_null(2)) {
    o.end_time = core::from_epoch_ms(st.int64(2));
  }
  o.status = static_cast<OutcomeStatus>(st.int64(3));
  return o;
}

std::string upload_view_query(const char* where_and_order) {
  return std::string("SELECT ") + kAttemptColumns + ", " + kContentColumns +
         " FROM upload_attempts a LEFT JOIN content_records c ON c.sha256 = a.content_sha256 " +
         where_and_order;
}

}  // namespace

Ledger::Ledger(const std::string& db_path) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Ledger: failed to open " + db_path + ": " + msg);
  }
  try {
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    exec(db_, "PRAGMA foreign_keys = ON");
    exec(db_, "PRAGMA journal_mode = WAL");
    exec(db_, kSchema);
    migrate_caption_status(db_);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  spdlog::debug("ledger_opened path={}", db_path);
}

Ledger::~Ledger() {
  if (db_) {
    sqlite3_close(db_);
  }
}

ContentInsert Ledger::get_or_create_content_record(const std::string& content_hash,
                                                   const core::ContentDescriptor& descriptor,
                                                   TimePoint now) {
  std::lock_guard lock(mutex_);
  Transaction tx(db_);

  Statement ins(db_,
                "INSERT OR IGNORE INTO content_records "
                "(sha256, width, height, format, size_bytes, first_seen_ms) VALUES (?,?,?,?,?,?)");
  ins.bind(1, content_hash);
  ins.bind(2, static_cast<std::int64_t>(descriptor.width));
  ins.bind(3, static_cast<std::int64_t>(descriptor.height));
  ins.bind(4, descriptor.format);
  ins.bind(5, static_cast<std::int64_t>(descriptor.size_bytes));
  ins.bind(6, core::to_epoch_ms(now));
  ins.run();
  const bool was_new = sqlite3_changes(db_) == 1;

  auto record = find_content_record_locked(content_hash);
  if (!record) {
    throw LedgerException("ledger: content record vanished after insert: " + content_hash);
  }
  tx.commit();
  return ContentInsert{std::move(*record), was_new};
}

void Ledger::record_upload_attempt(const UploadAttempt& attempt, const ProcessingOutcome& outcome) {
  std::lock_guard lock(mutex_);
  Transaction tx(db_);

  Statement a(db_,
              "INSERT INTO upload_attempts "
              "(attempt_id, original_name, processed_at_ms, stored_path, content_sha256, error) "
              "VALUES (?,?,?,?,?,?)");
  a.bind(1, attempt.attempt_id);
  a.bind(2, attempt.original_name);
  a.bind(3, core::to_epoch_ms(attempt.processed_at));
  a.bind(4, attempt.stored_path);
  a.bind(5, attempt.content_hash);
  a.bind(6, attempt.error);
  a.run();

  Statement o(db_,
              "INSERT INTO processing_outcomes (attempt_id, start_ms, end_ms, status) VALUES (?,?,?,?)");
  o.bind(1, attempt.attempt_id);
  o.bind(2, core::to_epoch_ms(outcome.start_time));
  o.bind(3, outcome.end_time);
  o.bind(4, static_cast<std::int64_t>(outcome.status));
  o.run();

  tx.commit();
}

bool Ledger::record_outcome(const std::string& attempt_id, OutcomeStatus status, TimePoint end) {
  std::lock_guard lock(mutex_);
  Statement st(db_,
               "UPDATE processing_outcomes SET status = ?, end_ms = ? "
               "WHERE attempt_id = ? AND status = 0");
  st.bind(1, static_cast<std::int64_t>(status));
  st.bind(2, core::to_epoch_ms(end));
  st.bind(3, attempt_id);
  st.run();
  return sqlite3_changes(db_) == 1;
}

bool Ledger::update_content_field(const std::string& content_hash,
                                  ContentField field,
                                  const std::string& value) {
  const char* sql = field == ContentField::ExifJson
                        ? "UPDATE content_records SET exif_json = ? WHERE sha256 = ?"
                        : "UPDATE content_records SET caption = ? WHERE sha256 = ?";
  std::lock_guard lock(mutex_);
  Statement st(db_, sql);
  st.bind(1, value);
  st.bind(2, content_hash);
  st.run();
  return sqlite3_changes(db_) == 1;
}

std::size_t Ledger::settle_pending_locked(const std::string& content_hash,
                                          OutcomeStatus status,
                                          TimePoint end) {
  Statement st(db_,
               "UPDATE processing_outcomes SET status = ?, end_ms = ? "
               "WHERE status = 0 AND attempt_id IN "
               "(SELECT attempt_id FROM upload_attempts WHERE content_sha256 = ?)");
  st.bind(1, static_cast<std::int64_t>(status));
  st.bind(2, core::to_epoch_ms(end));
  st.bind(3, content_hash);
  st.run();
  const auto settled = static_cast<std::size_t>(sqlite3_changes(db_));

  // A captioned hash stays a success even if a later re-run fails.
  Statement mark(db_,
                 "UPDATE content_records SET caption_status = ? "
                 "WHERE sha256 = ? AND caption_status != 1");
  mark.bind(1, static_cast<std::int64_t>(status));
  mark.bind(2, content_hash);
  mark.run();
  return settled;
}

std::size_t Ledger::settle_pending_outcomes(const std::string& content_hash,
                                            OutcomeStatus status,
                                            TimePoint end) {
  std::lock_guard lock(mutex_);
  Transaction tx(db_);
  const std::size_t settled = settle_pending_locked(content_hash, status, end);
  tx.commit();
  return settled;
}

bool Ledger::reopen_caption(const std::string& content_hash) {
  std::lock_guard lock(mutex_);
  Statement st(db_, "UPDATE content_records SET caption_status = 0 WHERE sha256 = ? AND caption_status = 2");
  st.bind(1, content_hash);
  st.run();
  return sqlite3_changes(db_) == 1;
}

bool Ledger::complete_caption(const std::string& content_hash, const std::string& caption, TimePoint end) {
  std::lock_guard lock(mutex_);
  Transaction tx(db_);

  Statement st(db_, "UPDATE content_records SET caption = ?, caption_status = 1 WHERE sha256 = ?");
  st.bind(1, caption);
  st.bind(2, content_hash);
  st.run();
  if (sqlite3_changes(db_) != 1) {
    return false;
  }
  settle_pending_locked(content_hash, OutcomeStatus::Success, end);
  tx.commit();
  return true;
}

std::optional<ContentRecord> Ledger::find_content_record_locked(const std::string& content_hash) {
  Statement st(db_, std::string("SELECT ") + kContentColumns + " FROM content_records c WHERE c.sha256 = ?");
  st.bind(1, content_hash);
  if (!st.step()) {
    return std::nullopt;
  }
  return read_content(st, 0);
}

std::optional<ContentRecord> Ledger::find_content_record(const std::string& content_hash) {
  std::lock_guard lock(mutex_);
  return find_content_record_locked(content_hash);
}

std::optional<UploadView> Ledger::find_upload(const std::string& attempt_id) {
  std::lock_guard lock(mutex_);
  Statement st(db_, upload_view_query("WHERE a.attempt_id = ?"));
  st.bind(1, attempt_id);
  if (!st.step()) {
    return std::nullopt;
  }
  return read_view(st);
}

std::vector<UploadView> Ledger::list_uploads() {
  std::lock_guard lock(mutex_);
  Statement st(db_, upload_view_query("ORDER BY a.processed_at_ms DESC, a.rowid DESC"));
  std::vector<UploadView> out;
  while (st.step()) {
    out.push_back(read_view(st));
  }
  return out;
}

std::optional<ProcessingOutcome> Ledger::find_outcome(const std::string& attempt_id) {
  std::lock_guard lock(mutex_);
  Statement st(db_,
               "SELECT attempt_id, start_ms, end_ms, status FROM processing_outcomes WHERE attempt_id = ?");
  st.bind(1, attempt_id);
  if (!st.step()) {
    return std::nullopt;
  }
  return read_outcome(st);
}

std::vector<ProcessingOutcome> Ledger::list_outcomes() {
  std::lock_guard lock(mutex_);
  Statement st(db_, "SELECT attempt_id, start_ms, end_ms, status FROM processing_outcomes");
  std::vector<ProcessingOutcome> out;
  while (st.step()) {
    out.push_back(read_outcome(st));
  }
  return out;
}

std::optional<std::string> Ledger::find_stored_path(const std::string& content_hash) {
  std::lock_guard lock(mutex_);
  Statement st(db_,
               "SELECT stored_path FROM upload_attempts "
               "WHERE content_sha256 = ? AND stored_path IS NOT NULL "
               "ORDER BY processed_at_ms ASC, rowid ASC LIMIT 1");
  st.bind(1, content_hash);
  if (!st.step()) {
    return std::nullopt;
  }
  return st.text(0);
}

std::size_t Ledger::count_content_records() {
  std::lock_guard lock(mutex_);
  Statement st(db_, "SELECT COUNT(*) FROM content_records");
  return st.step() ? static_cast<std::size_t>(st.int64(0)) : 0;
}

std::size_t Ledger::count_upload_attempts() {
  std::lock_guard lock(mutex_);
  Statement st(db_, "SELECT COUNT(*) FROM upload_attempts");
  return st.step() ? static_cast<std::size_t>(st.int64(0)) : 0;
}

}  // namespace imgpipe::ledger
