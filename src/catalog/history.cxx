#include <sstream>

#include <history.hxx>

using namespace pgdumpctl;

OperationHistory::OperationHistory(std::string sqliteDB) {

  this->sqliteDB = sqliteDB;

}

OperationHistory::~OperationHistory() {

  try {
    this->close();
  } catch (CHistoryIssue &e) {
    BOOST_LOG_TRIVIAL(warning) << e.what();
  }

}

std::string OperationHistory::fullname() {

  return this->sqliteDB;

}

bool OperationHistory::available() {

  return (this->isOpen && this->db_handle != NULL);

}

void OperationHistory::open_rw() {

  std::lock_guard<std::mutex> guard(this->mtx);
  int rc;

  if (this->isOpen)
    return;

  rc = sqlite3_open(this->sqliteDB.c_str(), &(this->db_handle));

  if (rc) {
    std::ostringstream oss;
    oss << "cannot open history catalog " << this->sqliteDB
        << ": " << sqlite3_errmsg(this->db_handle);
    sqlite3_close(this->db_handle);
    this->db_handle = NULL;
    throw CHistoryIssue(oss.str());
  }

  this->isOpen = true;

  try {
    setPragma();
    createSchema();
  } catch (CHistoryIssue &e) {
    sqlite3_close(this->db_handle);
    this->db_handle = NULL;
    this->isOpen = false;
    throw;
  }

}

void OperationHistory::close() {

  std::lock_guard<std::mutex> guard(this->mtx);

  if (this->available()) {

    int rc = sqlite3_close(this->db_handle);

    if (rc == SQLITE_OK) {
      this->isOpen = false;
      this->db_handle = NULL;
    } else if (rc == SQLITE_BUSY) {
      throw CHistoryIssue("attempt to close busy history catalog");
    }

  }

}

void OperationHistory::exec(std::string sql) {

  int rc;
  char *errmsg = NULL;

  rc = sqlite3_exec(this->db_handle, sql.c_str(), NULL, NULL, &errmsg);

  if (rc != SQLITE_OK) {
    std::ostringstream oss;
    oss << "error executing \"" << sql << "\": "
        << ((errmsg != NULL) ? errmsg : sqlite3_errmsg(this->db_handle));
    sqlite3_free(errmsg);
    throw CHistoryIssue(oss.str());
  }

}

void OperationHistory::setPragma() {

  exec("PRAGMA journal_mode=WAL;");

  /*
   * Concurrent shells may write to the same file, give them
   * some time to finish.
   */
  exec("PRAGMA busy_timeout=10000;");

}

void OperationHistory::createSchema() {

  exec("CREATE TABLE IF NOT EXISTS history("
       "id INTEGER PRIMARY KEY AUTOINCREMENT, "
       "connection TEXT NOT NULL, "
       "action TEXT NOT NULL, "
       "artifact TEXT, "
       "status TEXT NOT NULL, "
       "error TEXT NOT NULL, "
       "exit_code INTEGER, "
       "duration_ms INTEGER, "
       "started TEXT NOT NULL, "
       "message TEXT);");

  exec("CREATE INDEX IF NOT EXISTS history_connection_idx ON history(connection);");

}

int OperationHistory::record(const OperationResult &result) {

  std::lock_guard<std::mutex> guard(this->mtx);
  sqlite3_stmt *stmt;
  int rc;
  std::string action = OperationResult::actionName(result.action);
  std::string status = OperationResult::statusName(result.status);
  std::string error = OperationResult::errorName(result.error);
  std::string started = CPGDumpCtlBase::time_to_str(result.started);

  if (!this->available())
    throw CHistoryIssue("history catalog is not opened");

  rc = sqlite3_prepare_v2(this->db_handle,
                          "INSERT INTO history(connection, action, artifact, status, error, "
                          "exit_code, duration_ms, started, message) "
                          "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9);",
                          -1,
                          &stmt,
                          NULL);

  if (rc != SQLITE_OK) {
    std::ostringstream oss;
    oss << "error preparing history insert: " << sqlite3_errmsg(this->db_handle);
    throw CHistoryIssue(oss.str());
  }

  sqlite3_bind_text(stmt, 1, result.connection.c_str(), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 2, action.c_str(), -1, SQLITE_STATIC);

  if (result.artifact.empty())
    sqlite3_bind_null(stmt, 3);
  else
    sqlite3_bind_text(stmt, 3, result.artifact.c_str(), -1, SQLITE_STATIC);

  sqlite3_bind_text(stmt, 4, status.c_str(), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 5, error.c_str(), -1, SQLITE_STATIC);
  sqlite3_bind_int(stmt, 6, result.exitCode);
  sqlite3_bind_int64(stmt, 7, (sqlite3_int64) result.durationMs);
  sqlite3_bind_text(stmt, 8, started.c_str(), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt, 9, result.message.c_str(), -1, SQLITE_STATIC);

  rc = sqlite3_step(stmt);

  if (rc != SQLITE_DONE) {
    std::ostringstream oss;
    oss << "error recording operation in history: " << sqlite3_errmsg(this->db_handle);
    sqlite3_finalize(stmt);
    throw CHistoryIssue(oss.str());
  }

  sqlite3_finalize(stmt);

  return (int) sqlite3_last_insert_rowid(this->db_handle);

}

std::vector<HistoryEntry> OperationHistory::list(std::string connection,
                                                 unsigned int limit) {

  std::lock_guard<std::mutex> guard(this->mtx);
  std::vector<HistoryEntry> result;
  sqlite3_stmt *stmt;
  int rc;

  if (!this->available())
    throw CHistoryIssue("history catalog is not opened");

  rc = sqlite3_prepare_v2(this->db_handle,
                          "SELECT id, connection, action, artifact, status, error, "
                          "exit_code, duration_ms, started, message FROM history "
                          "WHERE ?1 = '' OR connection = ?1 "
                          "ORDER BY id DESC LIMIT ?2;",
                          -1,
                          &stmt,
                          NULL);

  if (rc != SQLITE_OK) {
    std::ostringstream oss;
    oss << "error preparing history query: " << sqlite3_errmsg(this->db_handle);
    throw CHistoryIssue(oss.str());
  }

  sqlite3_bind_text(stmt, 1, connection.c_str(), -1, SQLITE_STATIC);
  sqlite3_bind_int(stmt, 2, (int) limit);

  rc = sqlite3_step(stmt);

  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    std::ostringstream oss;
    sqlite3_finalize(stmt);
    oss << "unexpected result in history query: " << sqlite3_errmsg(this->db_handle);
    throw CHistoryIssue(oss.str());
  }

  while (rc == SQLITE_ROW) {

    HistoryEntry entry;

    entry.id = sqlite3_column_int(stmt, 0);
    entry.connection = (char *) sqlite3_column_text(stmt, 1);
    entry.action = (char *) sqlite3_column_text(stmt, 2);

    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL)
      entry.artifact = (char *) sqlite3_column_text(stmt, 3);

    entry.status = (char *) sqlite3_column_text(stmt, 4);
    entry.error = (char *) sqlite3_column_text(stmt, 5);

    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL)
      entry.exitCode = sqlite3_column_int(stmt, 6);

    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL)
      entry.durationMs = sqlite3_column_int64(stmt, 7);

    entry.started = (char *) sqlite3_column_text(stmt, 8);

    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL)
      entry.message = (char *) sqlite3_column_text(stmt, 9);

    result.push_back(entry);
    rc = sqlite3_step(stmt);

  }

  if (rc != SQLITE_DONE) {
    std::ostringstream oss;
    oss << "error reading history: " << sqlite3_errmsg(this->db_handle);
    sqlite3_finalize(stmt);
    throw CHistoryIssue(oss.str());
  }

  sqlite3_finalize(stmt);

  return result;

}
