#ifndef __HAVE_SCHEMAWIPER_HXX__
#define __HAVE_SCHEMAWIPER_HXX__

#include <memory>
#include <string>
#include <vector>

#include <libpq-fe.h>

#include <connections.hxx>
#include <rtconfig.hxx>
#include <signalhandler.hxx>

namespace pgdumpctl {

  /**
   * Dropping the tables of a database failed. Nothing
   * was dropped in this case.
   */
  class CWipeFailed : public CPGDumpCtlFailure {
  public:
    CWipeFailed(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    CWipeFailed(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

  /**
   * Removes all user tables of a connection's database ahead
   * of a clean restore.
   */
  class SchemaWiper {
  public:

    SchemaWiper();
    virtual ~SchemaWiper();

    /**
     * Drops every table in scope with CASCADE. All or nothing:
     * throws CWipeFailed (or COperationCancelled) with nothing
     * dropped if any statement fails or cancellation is requested
     * before the commit.
     */
    virtual void wipeAllTables(std::shared_ptr<const ConnectionConfig> connection,
                               JobSignalHandler *cancel) = 0;

  };

  /**
   * SchemaWiper talking to the database directly via libpq.
   *
   * Each wipe opens its own connection, so a single instance
   * can serve wipes of different connections at the same time.
   */
  class PGSchemaWiper : public SchemaWiper, public RuntimeVariableEnvironment {
  private:

    PGconn *connect(std::shared_ptr<const ConnectionConfig> connection);

    /* Executes a command not returning tuples, throws CWipeFailed */
    void exec(PGconn *pgconn, std::string command);

    /* Best effort, used on error paths only */
    void rollback(PGconn *pgconn);

    std::vector<std::pair<std::string, std::string>>
    listTables(PGconn *pgconn, std::shared_ptr<const ConnectionConfig> connection);

  public:

    PGSchemaWiper(std::shared_ptr<RuntimeConfiguration> rtc);
    virtual ~PGSchemaWiper();

    virtual void wipeAllTables(std::shared_ptr<const ConnectionConfig> connection,
                               JobSignalHandler *cancel);

    /**
     * Quotes an identifier, embedded double quotes are doubled.
     */
    static std::string quoteIdent(std::string ident);

    static std::string dropStatement(std::string schema, std::string table);

    /**
     * Catalog query listing schema and table names. With schemaCount > 0
     * the query expects the schema names as parameters $1..$n, otherwise
     * all non-system schemas are considered.
     */
    static std::string tableQuery(size_t schemaCount);

  };

}

#endif
