#ifndef __HAVE_PGDUMPCTL_SIGNALHANDLER__
#define __HAVE_PGDUMPCTL_SIGNALHANDLER__

#include <atomic>
#include <signal.h>

namespace pgdumpctl {

  /**
   * Cancellation token passed down to long running
   * operations. check() returns true as soon as the
   * operation should stop.
   *
   * Implementations must not reset their state in check(), since
   * a single run polls it many times.
   */
  class JobSignalHandler {
  public:
    JobSignalHandler();
    virtual ~JobSignalHandler();

    virtual bool check() = 0;
  };

  /**
   * Checks a sig_atomic_t flag set from a signal handler
   * against a reference value.
   */
  class AtomicSignalHandler : public JobSignalHandler {
  protected:
    int ref_value = -1;
    volatile sig_atomic_t *ref_var = nullptr;
  public:
    AtomicSignalHandler();
    AtomicSignalHandler(volatile sig_atomic_t *ref_var, int ref_value);
    virtual ~AtomicSignalHandler();

    virtual bool check();
  };

  /**
   * Programmatic cancellation, safe to trigger from
   * another thread than the one executing the operation.
   */
  class CancellationHandler : public JobSignalHandler {
  protected:
    std::atomic<bool> cancelled;
  public:
    CancellationHandler();
    virtual ~CancellationHandler();

    virtual void cancel();
    virtual void reset();
    virtual bool check();
  };

  /**
   * Helper for operations accepting an optional handler. A
   * nullptr handler never requests cancellation.
   */
  inline bool cancellation_requested(JobSignalHandler *handler) {
    return (handler != nullptr) && handler->check();
  }

}

#endif
