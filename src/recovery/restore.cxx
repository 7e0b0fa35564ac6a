#include <sstream>

#include <restore.hxx>

using namespace pgdumpctl;

RestoreOperation::RestoreOperation(std::shared_ptr<DumpCatalog> catalog,
                                   std::shared_ptr<SchemaWiper> wiper,
                                   std::shared_ptr<ProcessRunner> runner,
                                   std::shared_ptr<RuntimeConfiguration> rtc)
  : RuntimeVariableEnvironment(rtc) {

  if (catalog == nullptr || wiper == nullptr || runner == nullptr)
    throw CPGDumpCtlFailure("restore operation requires catalog, wiper and process runner");

  this->catalog = catalog;
  this->wiper = wiper;
  this->runner = runner;

  if (this->runtime_config == nullptr)
    this->runtime_config = RuntimeVariableEnvironment::createRuntimeConfiguration();

  this->trace.push_back(RESTORE_IDLE);

}

RestoreOperation::~RestoreOperation() {}

std::string RestoreOperation::stateName(RestoreState state) {

  switch(state) {
  case RESTORE_IDLE:
    return "idle";
  case RESTORE_VALIDATING:
    return "validating";
  case RESTORE_WIPING:
    return "wiping";
  case RESTORE_RESTORING:
    return "restoring";
  case RESTORE_SUCCEEDED:
    return "succeeded";
  case RESTORE_FAILED:
    return "failed";
  case RESTORE_CANCELLED:
    return "cancelled";
  }

  return "unknown";

}

RestoreState RestoreOperation::getState() {

  return this->state;

}

std::vector<RestoreState> RestoreOperation::getTrace() {

  return this->trace;

}

void RestoreOperation::transition(RestoreState next) {

  bool valid = false;

  switch(this->state) {
  case RESTORE_IDLE:
    valid = (next == RESTORE_VALIDATING);
    break;
  case RESTORE_VALIDATING:
    valid = (next == RESTORE_WIPING || next == RESTORE_RESTORING
             || next == RESTORE_FAILED || next == RESTORE_CANCELLED);
    break;
  case RESTORE_WIPING:
    valid = (next == RESTORE_RESTORING
             || next == RESTORE_FAILED || next == RESTORE_CANCELLED);
    break;
  case RESTORE_RESTORING:
    valid = (next == RESTORE_SUCCEEDED
             || next == RESTORE_FAILED || next == RESTORE_CANCELLED);
    break;
  default:
    /* final states */
    valid = false;
    break;
  }

  if (!valid) {
    std::ostringstream oss;
    oss << "invalid restore state transition from " << stateName(this->state)
        << " to " << stateName(next);
    throw CPGDumpCtlFailure(oss.str());
  }

  BOOST_LOG_TRIVIAL(debug) << "restore state " << stateName(this->state)
                           << " -> " << stateName(next);

  this->state = next;
  this->trace.push_back(next);

}

ProcessCommand RestoreOperation::buildCommand(std::shared_ptr<const ConnectionConfig> connection,
                                              boost::filesystem::path dumpFile,
                                              std::string executable,
                                              bool noOwner,
                                              bool noPrivileges) {

  ProcessCommand cmd;

  cmd.executable = executable;

  cmd.args.push_back("-h");
  cmd.args.push_back(connection->host);
  cmd.args.push_back("-p");
  cmd.args.push_back(CPGDumpCtlBase::intToStr(connection->port));
  cmd.args.push_back("-U");
  cmd.args.push_back(connection->user);
  cmd.args.push_back("-d");
  cmd.args.push_back(connection->dbname);
  cmd.args.push_back("--no-password");

  if (noOwner)
    cmd.args.push_back("--no-owner");

  if (noPrivileges)
    cmd.args.push_back("--no-privileges");

  cmd.args.push_back(dumpFile.string());

  if (!connection->password.empty())
    cmd.environment["PGPASSWORD"] = connection->password;

  return cmd;

}

DumpArtifact RestoreOperation::validate(std::shared_ptr<const ConnectionConfig> connection,
                                        const RestoreRequest &request) {

  /*
   * Must be checked first: a protected connection neither
   * gets its artifact resolved nor wiped.
   */
  if (connection->preventRestore) {
    throw CRestoreDisabled("restore is disabled for connection \""
                           + connection->name + "\"");
  }

  return this->catalog->resolve(connection, request.artifactId);

}

OperationResult RestoreOperation::finish(OperationResult result, RestoreState final_state) {

  transition(final_state);
  result.action = ACTION_RESTORE;

  return result;

}

OperationResult RestoreOperation::execute(std::shared_ptr<const ConnectionConfig> connection,
                                          const RestoreRequest &request,
                                          JobSignalHandler *cancel) {

  DumpArtifact artifact;
  OperationResult result;
  std::chrono::steady_clock::time_point start = CPGDumpCtlBase::current_hires_time_point();
  std::time_t started = std::time(NULL);

  if (connection == nullptr)
    throw CPGDumpCtlFailure("cannot restore into undefined connection");

  if (connection->name != request.connection) {
    throw CPGDumpCtlFailure("restore request for \"" + request.connection
                            + "\" executed against connection \"" + connection->name + "\"");
  }

  /* every run starts from scratch */
  this->state = RESTORE_IDLE;
  this->trace.clear();
  this->trace.push_back(RESTORE_IDLE);

  transition(RESTORE_VALIDATING);

  try {
    artifact = validate(connection, request);
  } catch (CRestoreDisabled &e) {
    BOOST_LOG_TRIVIAL(error) << e.what();
    result = finish(OperationResult::failure(OPERR_RESTORE_DISABLED, e.what()), RESTORE_FAILED);
  } catch (CDumpNotFound &e) {
    BOOST_LOG_TRIVIAL(error) << e.what();
    result = finish(OperationResult::failure(OPERR_DUMP_NOT_FOUND, e.what()), RESTORE_FAILED);
  }

  if (this->state == RESTORE_VALIDATING && cancellation_requested(cancel)) {
    result = finish(OperationResult::cancelled("restore cancelled before it started"),
                    RESTORE_CANCELLED);
  }

  if (this->state == RESTORE_VALIDATING && request.cleanFirst) {

    transition(RESTORE_WIPING);

    try {
      this->wiper->wipeAllTables(connection, cancel);
    } catch (COperationCancelled &e) {
      BOOST_LOG_TRIVIAL(warning) << e.what();
      result = finish(OperationResult::cancelled(e.what()), RESTORE_CANCELLED);
    } catch (CWipeFailed &e) {
      BOOST_LOG_TRIVIAL(error) << "wipe of connection \"" << connection->name
                               << "\" failed: " << e.what();
      result = finish(OperationResult::failure(OPERR_WIPE_FAILED, e.what()), RESTORE_FAILED);
    }

  }

  if (this->state == RESTORE_VALIDATING || this->state == RESTORE_WIPING) {

    ProcessCommand cmd = buildCommand(connection, artifact.path,
                                      this->runtime_config->getString("pg_restore.binary"),
                                      this->runtime_config->getBool("restore.no_owner"),
                                      this->runtime_config->getBool("restore.no_privileges"));
    std::string conn_name = connection->name;

    cmd.configure(this->runtime_config);
    cmd.progress = [conn_name](const std::string &line) {
      BOOST_LOG_TRIVIAL(debug) << "pg_restore [" << conn_name << "]: " << line;
    };

    transition(RESTORE_RESTORING);

    BOOST_LOG_TRIVIAL(info) << "restoring " << artifact.path << " into connection \""
                            << connection->name << "\" (" << connection->describe() << ")";

    try {
      result = this->runner->run(cmd, cancel);
    } catch (std::exception &e) {
      transition(RESTORE_FAILED);
      throw;
    }

    switch(result.status) {
    case OPERATION_SUCCEEDED:
      result = finish(result, RESTORE_SUCCEEDED);
      break;
    case OPERATION_CANCELLED:
      result = finish(result, RESTORE_CANCELLED);
      break;
    default:
      result = finish(result, RESTORE_FAILED);
      break;
    }

    result.artifact = artifact.path.string();

  }

  result.connection = connection->name;
  result.started = started;
  result.durationMs = CPGDumpCtlBase::duration_get_ms(
    CPGDumpCtlBase::calculate_duration_ms(start, CPGDumpCtlBase::current_hires_time_point()));

  return result;

}
