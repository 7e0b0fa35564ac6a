#ifndef __HAVE_ORCHESTRATION_HXX__
#define __HAVE_ORCHESTRATION_HXX__

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <connections.hxx>
#include <dump.hxx>
#include <dumpcatalog.hxx>
#include <history.hxx>
#include <operationlock.hxx>
#include <processrunner.hxx>
#include <restore.hxx>
#include <rtconfig.hxx>
#include <schemawiper.hxx>

namespace pgdumpctl {

  /**
   * Entry point for dump, restore and listing requests against
   * named connections.
   *
   * dump() and restore() never throw, every failure is
   * translated into the returned OperationResult. At most one of
   * them runs per connection at any time, a concurrent request is
   * rejected with OPERR_OPERATION_IN_PROGRESS.
   */
  class OrchestrationEngine : public RuntimeVariableEnvironment {
  private:

    std::shared_ptr<ConnectionRegistry> registry = nullptr;
    std::shared_ptr<DumpCatalog> catalog = nullptr;
    std::shared_ptr<ProcessRunner> runner = nullptr;
    std::shared_ptr<SchemaWiper> wiper = nullptr;
    std::shared_ptr<OperationHistory> history = nullptr;

    /* Protects history, operations read it from their own threads */
    std::mutex history_mtx;
    std::shared_ptr<OperationLockRegistry> locks = nullptr;

    /* Fills in run metadata, logs the outcome and journals it */
    OperationResult complete(OperationResult result,
                             OperationAction action,
                             std::string connection,
                             std::chrono::steady_clock::time_point start,
                             std::time_t started);

  public:

    OrchestrationEngine(std::shared_ptr<ConnectionRegistry> registry,
                        std::shared_ptr<DumpCatalog> catalog,
                        std::shared_ptr<ProcessRunner> runner,
                        std::shared_ptr<SchemaWiper> wiper,
                        std::shared_ptr<RuntimeConfiguration> rtc);
    virtual ~OrchestrationEngine();

    /**
     * Journal every dump and restore into the given history,
     * nullptr detaches it.
     */
    virtual void attachHistory(std::shared_ptr<OperationHistory> history);
    virtual std::shared_ptr<OperationHistory> getHistory();

    virtual std::vector<std::shared_ptr<const ConnectionConfig>> connections();

    /**
     * Lists completed dumps of the connection, newest first.
     * Throws CUnknownConnection.
     */
    virtual std::vector<DumpArtifact> listDumps(std::string name);

    virtual OperationResult dump(std::string name,
                                 JobSignalHandler *cancel = nullptr);

    virtual OperationResult restore(std::string name,
                                    std::string artifactId,
                                    bool cleanFirst,
                                    JobSignalHandler *cancel = nullptr);

    /* True while a dump or restore of the connection runs */
    virtual bool isBusy(std::string name);

  };

}

#endif
