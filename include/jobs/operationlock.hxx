#ifndef __HAVE_OPERATIONLOCK_HXX__
#define __HAVE_OPERATIONLOCK_HXX__

#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <common.hxx>

namespace pgdumpctl {

  /**
   * Another dump or restore currently owns the connection.
   */
  class COperationInProgress : public CPGDumpCtlFailure {
  public:
    COperationInProgress(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    COperationInProgress(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

  /**
   * Set of connection names with an active operation. Requests
   * for a busy connection are rejected, never queued.
   */
  class OperationLockRegistry {
  private:
    std::mutex mtx;
    std::set<std::string> active;
  public:

    OperationLockRegistry();
    virtual ~OperationLockRegistry();

    /**
     * Marks the connection busy. Returns false if it
     * already is.
     */
    virtual bool tryAcquire(std::string connection);
    virtual void release(std::string connection);
    virtual bool isActive(std::string connection);

  };

  /**
   * Holds the lock of a connection for the lifetime of the
   * guard. Throws COperationInProgress on construction if the
   * connection is busy.
   */
  class OperationLockGuard {
  private:
    std::shared_ptr<OperationLockRegistry> registry;
    std::string connection;
  public:

    OperationLockGuard(std::shared_ptr<OperationLockRegistry> registry,
                       std::string connection);
    ~OperationLockGuard();

    OperationLockGuard(const OperationLockGuard &) = delete;
    OperationLockGuard &operator=(const OperationLockGuard &) = delete;

  };

}

#endif
