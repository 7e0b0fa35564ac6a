#ifndef __HAVE_HISTORY_HXX__
#define __HAVE_HISTORY_HXX__

#include <sqlite3.h>

#include <mutex>
#include <string>
#include <vector>

#include <common.hxx>
#include <operation.hxx>

namespace pgdumpctl {

  /*
   * History catalog exception.
   */
  class CHistoryIssue : public CPGDumpCtlFailure {
  public:
    CHistoryIssue(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    CHistoryIssue(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

  /*
   * A row of the history table.
   */
  class HistoryEntry {
  public:
    int id = -1;
    std::string connection = "";
    std::string action = "";
    std::string artifact = "";
    std::string status = "";
    std::string error = "";
    int exitCode = -1;
    long long durationMs = 0;
    std::string started = "";
    std::string message = "";
  };

  /*
   * Journal of dump and restore runs, kept in a SQLite
   * database. The table is created on open if necessary.
   */
  class OperationHistory {
  private:
    sqlite3 *db_handle = NULL;
    std::mutex mtx;

    void setPragma();
    void createSchema();
    void exec(std::string sql);

  protected:
    std::string sqliteDB;
    bool isOpen = false;

  public:

    OperationHistory(std::string sqliteDB);
    virtual ~OperationHistory();

    virtual void open_rw();
    virtual void close();
    virtual bool available();
    virtual std::string fullname();

    /**
     * Stores the result, returns the id of the new entry.
     */
    virtual int record(const OperationResult &result);

    /**
     * Returns the newest entries first. An empty connection
     * name lists entries of all connections.
     */
    virtual std::vector<HistoryEntry> list(std::string connection,
                                           unsigned int limit = 20);

  };

}

#endif
