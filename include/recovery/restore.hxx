#ifndef __HAVE_RESTORE_HXX__
#define __HAVE_RESTORE_HXX__

#include <memory>
#include <string>
#include <vector>

#include <connections.hxx>
#include <dumpcatalog.hxx>
#include <processrunner.hxx>
#include <rtconfig.hxx>
#include <schemawiper.hxx>

namespace pgdumpctl {

  /**
   * Restore requested for a connection with
   * prevent_restore set.
   */
  class CRestoreDisabled : public CPGDumpCtlFailure {
  public:
    CRestoreDisabled(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    CRestoreDisabled(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

  /**
   * Parameters of a single restore run.
   */
  class RestoreRequest {
  public:

    std::string connection = "";

    /* File name of the dump, see DumpArtifact::id */
    std::string artifactId = "";

    /* Drop all tables before running pg_restore */
    bool cleanFirst = false;

  };

  typedef enum {

                RESTORE_IDLE,
                RESTORE_VALIDATING,
                RESTORE_WIPING,
                RESTORE_RESTORING,
                RESTORE_SUCCEEDED,
                RESTORE_FAILED,
                RESTORE_CANCELLED

  } RestoreState;

  /**
   * Restores a dump artifact into the database of a connection.
   *
   * A run walks through
   *
   * IDLE -> VALIDATING -> [WIPING ->] RESTORING -> SUCCEEDED|FAILED|CANCELLED
   *
   * where VALIDATING and WIPING may end the run in FAILED or
   * CANCELLED directly. pg_restore is never started after a
   * failed wipe.
   */
  class RestoreOperation : public RuntimeVariableEnvironment {
  private:

    std::shared_ptr<DumpCatalog> catalog = nullptr;
    std::shared_ptr<SchemaWiper> wiper = nullptr;
    std::shared_ptr<ProcessRunner> runner = nullptr;

    RestoreState state = RESTORE_IDLE;
    std::vector<RestoreState> trace;

    void transition(RestoreState next);

    /* Throws CRestoreDisabled or CDumpNotFound */
    DumpArtifact validate(std::shared_ptr<const ConnectionConfig> connection,
                          const RestoreRequest &request);

    OperationResult finish(OperationResult result, RestoreState final_state);

  public:

    RestoreOperation(std::shared_ptr<DumpCatalog> catalog,
                     std::shared_ptr<SchemaWiper> wiper,
                     std::shared_ptr<ProcessRunner> runner,
                     std::shared_ptr<RuntimeConfiguration> rtc);
    virtual ~RestoreOperation();

    /**
     * Executes the restore. Documented failures (restore disabled,
     * dump not found, wipe failure, pg_restore failure, cancellation)
     * are reported through the result.
     */
    virtual OperationResult execute(std::shared_ptr<const ConnectionConfig> connection,
                                    const RestoreRequest &request,
                                    JobSignalHandler *cancel);

    RestoreState getState();

    /* States visited by the last run, starting with RESTORE_IDLE */
    std::vector<RestoreState> getTrace();

    static std::string stateName(RestoreState state);

    static ProcessCommand buildCommand(std::shared_ptr<const ConnectionConfig> connection,
                                       boost::filesystem::path dumpFile,
                                       std::string executable,
                                       bool noOwner,
                                       bool noPrivileges);

  };

}

#endif
