#include <sstream>

#include <schemawiper.hxx>

using namespace pgdumpctl;

SchemaWiper::SchemaWiper() {}

SchemaWiper::~SchemaWiper() {}

PGSchemaWiper::PGSchemaWiper(std::shared_ptr<RuntimeConfiguration> rtc)
  : SchemaWiper(), RuntimeVariableEnvironment(rtc) {

  if (this->runtime_config == nullptr)
    this->runtime_config = RuntimeVariableEnvironment::createRuntimeConfiguration();

}

PGSchemaWiper::~PGSchemaWiper() {}

std::string PGSchemaWiper::quoteIdent(std::string ident) {

  std::ostringstream quoted;

  quoted << '"';

  for (char c : ident) {
    if (c == '"')
      quoted << '"';
    quoted << c;
  }

  quoted << '"';

  return quoted.str();

}

std::string PGSchemaWiper::dropStatement(std::string schema, std::string table) {

  return "DROP TABLE IF EXISTS " + quoteIdent(schema) + "." + quoteIdent(table) + " CASCADE";

}

std::string PGSchemaWiper::tableQuery(size_t schemaCount) {

  std::ostringstream query;

  query << "SELECT schemaname, tablename FROM pg_catalog.pg_tables WHERE ";

  if (schemaCount > 0) {

    query << "schemaname IN (";

    for (size_t i = 1; i <= schemaCount; i++) {
      if (i > 1)
        query << ", ";
      query << "$" << i;
    }

    query << ")";

  } else {

    query << "schemaname NOT IN ('pg_catalog', 'information_schema')"
          << " AND schemaname NOT LIKE 'pg\\_toast%'"
          << " AND schemaname NOT LIKE 'pg\\_temp%'";

  }

  query << " ORDER BY schemaname, tablename";

  return query.str();

}

PGconn *PGSchemaWiper::connect(std::shared_ptr<const ConnectionConfig> connection) {

  std::string port = CPGDumpCtlBase::intToStr(connection->port);
  std::string connect_timeout
    = CPGDumpCtlBase::intToStr(this->runtime_config->getInt("wipe.connect_timeout"));
  std::vector<const char *> keywords;
  std::vector<const char *> values;

  keywords.push_back("host");             values.push_back(connection->host.c_str());
  keywords.push_back("port");             values.push_back(port.c_str());
  keywords.push_back("dbname");           values.push_back(connection->dbname.c_str());
  keywords.push_back("user");             values.push_back(connection->user.c_str());
  keywords.push_back("connect_timeout");  values.push_back(connect_timeout.c_str());
  keywords.push_back("application_name"); values.push_back("pg_dumpctl");

  if (!connection->password.empty()) {
    keywords.push_back("password");
    values.push_back(connection->password.c_str());
  }

  keywords.push_back(NULL);
  values.push_back(NULL);

  PGconn *pgconn = PQconnectdbParams(keywords.data(), values.data(), 0);

  if (pgconn == NULL)
    throw CWipeFailed("out of memory allocating database connection");

  if (PQstatus(pgconn) == CONNECTION_BAD) {
    std::ostringstream oss;
    oss << "database connection failure: " << PQerrorMessage(pgconn);

    /* Don't forget to cleanup PQ connection */
    PQfinish(pgconn);
    throw CWipeFailed(oss.str());
  }

  return pgconn;

}

void PGSchemaWiper::exec(PGconn *pgconn, std::string command) {

  PGresult *result = PQexec(pgconn, command.c_str());
  ExecStatusType es = PQresultStatus(result);

  if (es != PGRES_COMMAND_OK) {
    std::ostringstream oss;
    oss << command << " failed: " << PQresultErrorMessage(result);
    PQclear(result);
    throw CWipeFailed(oss.str());
  }

  PQclear(result);

}

void PGSchemaWiper::rollback(PGconn *pgconn) {

  PGresult *result = PQexec(pgconn, "ROLLBACK");

  if (PQresultStatus(result) != PGRES_COMMAND_OK) {
    BOOST_LOG_TRIVIAL(warning) << "ROLLBACK failed: " << PQresultErrorMessage(result);
  }

  PQclear(result);

}

std::vector<std::pair<std::string, std::string>>
PGSchemaWiper::listTables(PGconn *pgconn,
                          std::shared_ptr<const ConnectionConfig> connection) {

  std::vector<std::pair<std::string, std::string>> tables;
  std::vector<const char *> params;
  std::string query = tableQuery(connection->wipeSchemas.size());

  for (auto const &schema : connection->wipeSchemas)
    params.push_back(schema.c_str());

  PGresult *result = PQexecParams(pgconn, query.c_str(),
                                  (int) params.size(), NULL,
                                  params.empty() ? NULL : params.data(),
                                  NULL, NULL, 0);

  if (PQresultStatus(result) != PGRES_TUPLES_OK) {
    std::ostringstream oss;
    oss << "could not list tables: " << PQresultErrorMessage(result);
    PQclear(result);
    throw CWipeFailed(oss.str());
  }

  for (int i = 0; i < PQntuples(result); i++) {
    tables.push_back(std::make_pair(std::string(PQgetvalue(result, i, 0)),
                                    std::string(PQgetvalue(result, i, 1))));
  }

  PQclear(result);
  return tables;

}

void PGSchemaWiper::wipeAllTables(std::shared_ptr<const ConnectionConfig> connection,
                                  JobSignalHandler *cancel) {

  if (connection == nullptr)
    throw CWipeFailed("cannot wipe undefined connection");

  BOOST_LOG_TRIVIAL(info) << "wiping tables of connection \"" << connection->name
                          << "\" (" << connection->describe() << ")";

  PGconn *pgconn = connect(connection);

  try {

    std::vector<std::pair<std::string, std::string>> tables;

    exec(pgconn, "BEGIN");

    tables = listTables(pgconn, connection);

    for (auto const &table : tables) {

      /*
       * Cancellation is honored between statements, the
       * transaction is rolled back below.
       */
      if (cancellation_requested(cancel))
        throw COperationCancelled("wipe cancelled, no tables dropped");

      BOOST_LOG_TRIVIAL(debug) << dropStatement(table.first, table.second);
      exec(pgconn, dropStatement(table.first, table.second));

    }

    if (cancellation_requested(cancel))
      throw COperationCancelled("wipe cancelled, no tables dropped");

    exec(pgconn, "COMMIT");

    BOOST_LOG_TRIVIAL(info) << "dropped " << tables.size() << " tables of connection \""
                            << connection->name << "\"";

  } catch (CPGDumpCtlFailure &e) {

    rollback(pgconn);
    PQfinish(pgconn);
    throw;

  }

  PQfinish(pgconn);

}
