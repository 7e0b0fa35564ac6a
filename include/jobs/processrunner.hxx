#ifndef __HAVE_PROCESSRUNNER_HXX__
#define __HAVE_PROCESSRUNNER_HXX__

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/circular_buffer.hpp>

#include <common.hxx>
#include <operation.hxx>
#include <rtconfig.hxx>
#include <signalhandler.hxx>

namespace pgdumpctl {

  /**
   * Failure to set up or supervise a child process
   * (pipe, fork or waitpid errors).
   */
  class CProcessFailure : public CPGDumpCtlFailure {
  public:
    CProcessFailure(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    CProcessFailure(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

  /* Receives the child's standard output line by line */
  typedef std::function<void(const std::string &line)> process_progress_sink;

  /**
   * Describes a single invocation of an external executable.
   */
  class ProcessCommand {
  public:

    /* Executable name (looked up in PATH) or path */
    std::string executable = "";

    /* Arguments, without the executable itself */
    std::vector<std::string> args;

    /*
     * Variables added to (or replacing entries of) the inherited
     * environment. Secrets like PGPASSWORD belong here, never
     * into args.
     */
    std::map<std::string, std::string> environment;

    /* If unset, standard output is discarded */
    process_progress_sink progress = nullptr;

    /* Seconds until the child is cancelled, 0 disables */
    int timeout = 0;

    /* Seconds between SIGTERM and SIGKILL on cancellation */
    int killGrace = 5;

    /* Capacity of the standard error tail buffer */
    size_t stderrTailBytes = 8192;

    /**
     * Applies process.* runtime variables (timeout, kill grace
     * and stderr tail size).
     */
    void configure(std::shared_ptr<RuntimeConfiguration> rtc);

    /**
     * Returns the command line for log output.
     */
    std::string commandLine() const;

  };

  /**
   * Bounded buffer keeping the last bytes written to it.
   */
  class OutputTail {
  private:
    boost::circular_buffer<char> buffer;
    bool truncated = false;
  public:

    OutputTail(size_t capacity);
    virtual ~OutputTail();

    void append(const char *data, size_t len);
    std::string str() const;
    bool wasTruncated() const;

  };

  /**
   * Spawns and supervises an external process. run() blocks
   * until the child has exited and reports its outcome.
   *
   * Failures of the child itself (non-zero exit, missing
   * executable, cancellation) are reported through the returned
   * OperationResult. CProcessFailure is only thrown if the
   * supervision machinery fails.
   */
  class ProcessRunner {
  public:

    ProcessRunner();
    virtual ~ProcessRunner();

    virtual OperationResult run(ProcessCommand &command,
                                JobSignalHandler *cancel) = 0;

  };

  /**
   * ProcessRunner forking local child processes.
   */
  class LocalProcessRunner : public ProcessRunner {
  private:

    /* Executables already reported missing */
    std::set<std::string> reported_missing;
    std::mutex reported_mutex;

    /* Poll interval while waiting for the child, in milliseconds */
    static const int poll_interval_ms = 100;

    void reportMissing(std::string executable);

  public:

    LocalProcessRunner();
    virtual ~LocalProcessRunner();

    virtual OperationResult run(ProcessCommand &command,
                                JobSignalHandler *cancel);

  };

}

#endif
