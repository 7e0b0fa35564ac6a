#ifndef __HAVE_PGDUMPCTL_OPERATION_HXX__
#define __HAVE_PGDUMPCTL_OPERATION_HXX__

#include <cstdint>
#include <ctime>
#include <string>

namespace pgdumpctl {

  typedef enum {

                OPERATION_SUCCEEDED,
                OPERATION_FAILED,
                OPERATION_CANCELLED

  } OperationStatus;

  /**
   * Failure classification of an operation. OPERR_INTERNAL
   * covers failures outside the documented taxonomy, e.g. a
   * dump directory which cannot be created.
   */
  typedef enum {

                OPERR_NONE,
                OPERR_UNKNOWN_CONNECTION,
                OPERR_DUMP_NOT_FOUND,
                OPERR_RESTORE_DISABLED,
                OPERR_OPERATION_IN_PROGRESS,
                OPERR_WIPE_FAILED,
                OPERR_PROCESS_FAILED,
                OPERR_CANCELLED,
                OPERR_INTERNAL

  } OperationError;

  typedef enum {

                ACTION_NONE,
                ACTION_DUMP,
                ACTION_RESTORE

  } OperationAction;

  /**
   * Outcome of a single dump, restore or external
   * process run. Produced per run, never persisted by
   * the operations themselves.
   */
  class OperationResult {
  public:

    OperationStatus status = OPERATION_FAILED;
    OperationError  error  = OPERR_NONE;
    OperationAction action = ACTION_NONE;

    /* Exit code of the external process, -1 if none ran */
    int exitCode = -1;

    /* Bounded tail of the process' standard error */
    std::string stderrTail = "";

    /* Human readable cause of a failure */
    std::string message = "";

    uint64_t durationMs = 0;

    std::string connection = "";

    /* Path of the artifact written or restored */
    std::string artifact = "";

    /* Start of the run, seconds since epoch */
    std::time_t started = 0;

    bool succeeded() const;

    static OperationResult failure(OperationError error,
                                   std::string message);
    static OperationResult cancelled(std::string message);

    static std::string statusName(OperationStatus status);
    static std::string errorName(OperationError error);
    static std::string actionName(OperationAction action);

  };

}

#endif
