#ifndef __HAVE_PGDUMPCTL_TEST_FAKES_HXX__
#define __HAVE_PGDUMPCTL_TEST_FAKES_HXX__

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

#include <processrunner.hxx>
#include <schemawiper.hxx>

namespace pgdumpctl {

  /*
   * Process runner recording its invocations instead of
   * forking anything.
   */
  class FakeProcessRunner : public ProcessRunner {
  private:
    std::mutex mtx;
    std::vector<ProcessCommand> commands;

  public:

    typedef enum {
                  FAKE_SUCCEED,
                  FAKE_FAIL,
                  FAKE_BLOCK_UNTIL_CANCELLED,
                  FAKE_THROW
    } FakeMode;

    FakeMode mode = FAKE_SUCCEED;

    /*
     * With FAKE_BLOCK_UNTIL_CANCELLED, only commands with an argument
     * containing this string block, all others succeed. Empty blocks
     * every command.
     */
    std::string blockMatching = "";

    /* Create the --file= target, like pg_dump does */
    bool writeOutput = true;

    int failExitCode = 1;
    std::string failStderr = "pg_dump: error: connection refused\n";

    /* Set as soon as a command blocks */
    std::atomic<bool> started;

    FakeProcessRunner() : ProcessRunner() { started = false; }
    virtual ~FakeProcessRunner() {}

    virtual OperationResult run(ProcessCommand &command,
                                JobSignalHandler *cancel) {

      OperationResult result;

      {
        std::lock_guard<std::mutex> guard(this->mtx);
        this->commands.push_back(command);
      }

      /* written before the outcome is decided, like a partial dump */
      if (this->writeOutput) {

        for (auto &arg : command.args) {
          if (boost::algorithm::starts_with(arg, "--file=")) {
            std::ofstream out(arg.substr(7));
            out << "PGDMP";
          }
        }

      }

      FakeMode effective = this->mode;

      if (effective == FAKE_BLOCK_UNTIL_CANCELLED && !this->blockMatching.empty()) {

        bool matches = false;

        for (auto &arg : command.args) {
          if (arg.find(this->blockMatching) != std::string::npos)
            matches = true;
        }

        if (!matches)
          effective = FAKE_SUCCEED;

      }

      if (effective == FAKE_BLOCK_UNTIL_CANCELLED)
        this->started = true;

      switch(effective) {

      case FAKE_SUCCEED:

        result.status = OPERATION_SUCCEEDED;
        result.error = OPERR_NONE;
        result.exitCode = 0;
        break;

      case FAKE_FAIL:

        result = OperationResult::failure(OPERR_PROCESS_FAILED,
                                          command.executable + " exited with code "
                                          + CPGDumpCtlBase::intToStr(this->failExitCode));
        result.exitCode = this->failExitCode;
        result.stderrTail = this->failStderr;
        break;

      case FAKE_BLOCK_UNTIL_CANCELLED:

        while (!cancellation_requested(cancel)) {
          std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        result = OperationResult::cancelled(command.executable + " cancelled");
        result.exitCode = 128 + SIGTERM;
        break;

      case FAKE_THROW:

        throw std::runtime_error("supervision of " + command.executable + " failed");

      }

      return result;

    }

    std::vector<ProcessCommand> getCommands() {
      std::lock_guard<std::mutex> guard(this->mtx);
      return this->commands;
    }

    size_t calls() {
      std::lock_guard<std::mutex> guard(this->mtx);
      return this->commands.size();
    }

  };

  /*
   * Schema wiper counting its invocations.
   */
  class FakeSchemaWiper : public SchemaWiper {
  public:

    typedef enum {
                  WIPE_SUCCEED,
                  WIPE_FAIL,
                  WIPE_CANCEL
    } FakeWipeMode;

    FakeWipeMode mode = WIPE_SUCCEED;
    std::atomic<int> calls;

    FakeSchemaWiper() : SchemaWiper() { calls = 0; }
    virtual ~FakeSchemaWiper() {}

    virtual void wipeAllTables(std::shared_ptr<const ConnectionConfig> connection,
                               JobSignalHandler *cancel) {

      this->calls++;

      if (this->mode == WIPE_FAIL)
        throw CWipeFailed("permission denied for table accounts");

      if (this->mode == WIPE_CANCEL)
        throw COperationCancelled("wipe cancelled");

    }

  };

  /*
   * Temporary directory removed at the end of the scope.
   */
  class TempDirectory {
  public:
    boost::filesystem::path path;

    TempDirectory() {
      path = boost::filesystem::temp_directory_path()
        / boost::filesystem::unique_path("pg_dumpctl-test-%%%%-%%%%-%%%%");
      boost::filesystem::create_directories(path);
    }

    ~TempDirectory() {
      boost::system::error_code ec;
      boost::filesystem::remove_all(path, ec);
    }
  };

  /*
   * Creates a file of the given size with the given
   * modification time.
   */
  inline void touch_file(boost::filesystem::path file, std::time_t mtime, size_t size = 5) {

    std::ofstream out(file.string());
    out << std::string(size, 'x');
    out.close();

    boost::filesystem::last_write_time(file, mtime);

  }

  inline ConnectionConfig make_connection(std::string name,
                                          boost::filesystem::path dumpPath) {

    ConnectionConfig config;

    config.name = name;
    config.host = "db.example.com";
    config.port = 5433;
    config.dbname = "app";
    config.user = "backup";
    config.password = "s3cret";
    config.dumpPath = dumpPath;

    return config;

  }

}

#endif
