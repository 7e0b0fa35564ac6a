#include <operation.hxx>

using namespace pgdumpctl;

bool OperationResult::succeeded() const {

  return (this->status == OPERATION_SUCCEEDED);

}

OperationResult OperationResult::failure(OperationError error,
                                         std::string message) {

  OperationResult result;

  result.status  = OPERATION_FAILED;
  result.error   = error;
  result.message = message;

  return result;

}

OperationResult OperationResult::cancelled(std::string message) {

  OperationResult result;

  result.status  = OPERATION_CANCELLED;
  result.error   = OPERR_CANCELLED;
  result.message = message;

  return result;

}

std::string OperationResult::statusName(OperationStatus status) {

  switch(status) {
  case OPERATION_SUCCEEDED:
    return "succeeded";
  case OPERATION_FAILED:
    return "failed";
  case OPERATION_CANCELLED:
    return "cancelled";
  }

  return "unknown";

}

std::string OperationResult::errorName(OperationError error) {

  switch(error) {
  case OPERR_NONE:
    return "none";
  case OPERR_UNKNOWN_CONNECTION:
    return "unknown connection";
  case OPERR_DUMP_NOT_FOUND:
    return "dump not found";
  case OPERR_RESTORE_DISABLED:
    return "restore disabled";
  case OPERR_OPERATION_IN_PROGRESS:
    return "operation in progress";
  case OPERR_WIPE_FAILED:
    return "wipe failed";
  case OPERR_PROCESS_FAILED:
    return "process failed";
  case OPERR_CANCELLED:
    return "cancelled";
  case OPERR_INTERNAL:
    return "internal error";
  }

  return "unknown";

}

std::string OperationResult::actionName(OperationAction action) {

  switch(action) {
  case ACTION_DUMP:
    return "dump";
  case ACTION_RESTORE:
    return "restore";
  case ACTION_NONE:
    break;
  }

  return "none";

}
