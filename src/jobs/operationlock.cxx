#include <operationlock.hxx>

using namespace pgdumpctl;

OperationLockRegistry::OperationLockRegistry() {}

OperationLockRegistry::~OperationLockRegistry() {}

bool OperationLockRegistry::tryAcquire(std::string connection) {

  std::lock_guard<std::mutex> guard(this->mtx);

  return this->active.insert(connection).second;

}

void OperationLockRegistry::release(std::string connection) {

  std::lock_guard<std::mutex> guard(this->mtx);

  this->active.erase(connection);

}

bool OperationLockRegistry::isActive(std::string connection) {

  std::lock_guard<std::mutex> guard(this->mtx);

  return (this->active.find(connection) != this->active.end());

}

OperationLockGuard::OperationLockGuard(std::shared_ptr<OperationLockRegistry> registry,
                                       std::string connection)
  : registry(registry), connection(connection) {

  if (this->registry == nullptr)
    throw CPGDumpCtlFailure("operation lock registry not initialized");

  if (!this->registry->tryAcquire(this->connection)) {
    throw COperationInProgress("another operation is in progress on connection \""
                               + this->connection + "\"");
  }

  BOOST_LOG_TRIVIAL(debug) << "acquired operation lock for connection \""
                           << this->connection << "\"";

}

OperationLockGuard::~OperationLockGuard() {

  this->registry->release(this->connection);

  BOOST_LOG_TRIVIAL(debug) << "released operation lock for connection \""
                           << this->connection << "\"";

}
