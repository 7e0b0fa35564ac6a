#include <sstream>

#include <orchestration.hxx>

using namespace pgdumpctl;

OrchestrationEngine::OrchestrationEngine(std::shared_ptr<ConnectionRegistry> registry,
                                         std::shared_ptr<DumpCatalog> catalog,
                                         std::shared_ptr<ProcessRunner> runner,
                                         std::shared_ptr<SchemaWiper> wiper,
                                         std::shared_ptr<RuntimeConfiguration> rtc)
  : RuntimeVariableEnvironment(rtc) {

  if (registry == nullptr)
    throw CPGDumpCtlFailure("orchestration engine requires a connection registry");

  if (catalog == nullptr || runner == nullptr || wiper == nullptr)
    throw CPGDumpCtlFailure("orchestration engine requires catalog, process runner and schema wiper");

  this->registry = registry;
  this->catalog = catalog;
  this->runner = runner;
  this->wiper = wiper;
  this->locks = std::make_shared<OperationLockRegistry>();

  if (this->runtime_config == nullptr)
    this->runtime_config = RuntimeVariableEnvironment::createRuntimeConfiguration();

}

OrchestrationEngine::~OrchestrationEngine() {}

void OrchestrationEngine::attachHistory(std::shared_ptr<OperationHistory> history) {

  std::lock_guard<std::mutex> guard(this->history_mtx);
  this->history = history;

}

std::shared_ptr<OperationHistory> OrchestrationEngine::getHistory() {

  std::lock_guard<std::mutex> guard(this->history_mtx);
  return this->history;

}

std::vector<std::shared_ptr<const ConnectionConfig>> OrchestrationEngine::connections() {

  return this->registry->list();

}

bool OrchestrationEngine::isBusy(std::string name) {

  return this->locks->isActive(name);

}

std::vector<DumpArtifact> OrchestrationEngine::listDumps(std::string name) {

  return this->catalog->list(this->registry->get(name));

}

OperationResult OrchestrationEngine::complete(OperationResult result,
                                              OperationAction action,
                                              std::string connection,
                                              std::chrono::steady_clock::time_point start,
                                              std::time_t started) {

  result.action = action;
  result.connection = connection;

  if (result.started == 0)
    result.started = started;

  if (result.durationMs == 0) {
    result.durationMs = CPGDumpCtlBase::duration_get_ms(
      CPGDumpCtlBase::calculate_duration_ms(start, CPGDumpCtlBase::current_hires_time_point()));
  }

  switch(result.status) {
  case OPERATION_SUCCEEDED:
    BOOST_LOG_TRIVIAL(info) << OperationResult::actionName(action) << " of connection \""
                            << connection << "\" succeeded in " << result.durationMs << " ms"
                            << (result.artifact.empty() ? "" : ", artifact " + result.artifact);
    break;
  case OPERATION_CANCELLED:
    BOOST_LOG_TRIVIAL(warning) << OperationResult::actionName(action) << " of connection \""
                               << connection << "\" cancelled: " << result.message;
    break;
  default:
    BOOST_LOG_TRIVIAL(error) << OperationResult::actionName(action) << " of connection \""
                             << connection << "\" failed ("
                             << OperationResult::errorName(result.error) << "): "
                             << result.message;
    if (!result.stderrTail.empty()) {
      BOOST_LOG_TRIVIAL(error) << "stderr output:" << std::endl << result.stderrTail;
    }
    break;
  }

  /*
   * The history is a journal only, a failure to write it
   * doesn't change the outcome of the operation.
   */
  std::shared_ptr<OperationHistory> journal = getHistory();

  if (journal != nullptr) {

    try {
      journal->record(result);
    } catch (CHistoryIssue &e) {
      BOOST_LOG_TRIVIAL(warning) << "could not record operation history: " << e.what();
    }

  }

  return result;

}

OperationResult OrchestrationEngine::dump(std::string name,
                                          JobSignalHandler *cancel) {

  std::chrono::steady_clock::time_point start = CPGDumpCtlBase::current_hires_time_point();
  std::time_t started = std::time(NULL);
  OperationResult result;

  BOOST_LOG_TRIVIAL(info) << "starting dump of connection \"" << name << "\"";

  try {

    std::shared_ptr<const ConnectionConfig> connection = this->registry->get(name);
    OperationLockGuard lock(this->locks, name);
    DumpOperation operation(this->runner, this->runtime_config);

    result = operation.execute(connection, cancel);

  } catch (CUnknownConnection &e) {
    result = OperationResult::failure(OPERR_UNKNOWN_CONNECTION, e.what());
  } catch (COperationInProgress &e) {
    result = OperationResult::failure(OPERR_OPERATION_IN_PROGRESS, e.what());
  } catch (COperationCancelled &e) {
    result = OperationResult::cancelled(e.what());
  } catch (CPGDumpCtlFailure &e) {
    result = OperationResult::failure(OPERR_INTERNAL, e.what());
  } catch (std::exception &e) {
    result = OperationResult::failure(OPERR_INTERNAL, e.what());
  }

  return complete(result, ACTION_DUMP, name, start, started);

}

OperationResult OrchestrationEngine::restore(std::string name,
                                             std::string artifactId,
                                             bool cleanFirst,
                                             JobSignalHandler *cancel) {

  std::chrono::steady_clock::time_point start = CPGDumpCtlBase::current_hires_time_point();
  std::time_t started = std::time(NULL);
  OperationResult result;
  RestoreRequest request;

  request.connection = name;
  request.artifactId = artifactId;
  request.cleanFirst = cleanFirst;

  BOOST_LOG_TRIVIAL(info) << "starting restore of \"" << artifactId
                          << "\" into connection \"" << name << "\""
                          << (cleanFirst ? " (clean)" : "");

  try {

    std::shared_ptr<const ConnectionConfig> connection = this->registry->get(name);
    OperationLockGuard lock(this->locks, name);
    RestoreOperation operation(this->catalog, this->wiper,
                               this->runner, this->runtime_config);

    result = operation.execute(connection, request, cancel);

  } catch (CUnknownConnection &e) {
    result = OperationResult::failure(OPERR_UNKNOWN_CONNECTION, e.what());
  } catch (COperationInProgress &e) {
    result = OperationResult::failure(OPERR_OPERATION_IN_PROGRESS, e.what());
  } catch (CRestoreDisabled &e) {
    result = OperationResult::failure(OPERR_RESTORE_DISABLED, e.what());
  } catch (CDumpNotFound &e) {
    result = OperationResult::failure(OPERR_DUMP_NOT_FOUND, e.what());
  } catch (CWipeFailed &e) {
    result = OperationResult::failure(OPERR_WIPE_FAILED, e.what());
  } catch (COperationCancelled &e) {
    result = OperationResult::cancelled(e.what());
  } catch (CPGDumpCtlFailure &e) {
    result = OperationResult::failure(OPERR_INTERNAL, e.what());
  } catch (std::exception &e) {
    result = OperationResult::failure(OPERR_INTERNAL, e.what());
  }

  return complete(result, ACTION_RESTORE, name, start, started);

}
