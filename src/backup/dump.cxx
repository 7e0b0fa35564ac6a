#include <sstream>

#include <dump.hxx>

using namespace pgdumpctl;
namespace bfs = boost::filesystem;

/* Upper bound for collision suffixes of artifact names */
#define MAX_ARTIFACT_SEQUENCE 1000

DumpOperation::DumpOperation(std::shared_ptr<ProcessRunner> runner,
                             std::shared_ptr<RuntimeConfiguration> rtc)
  : RuntimeVariableEnvironment(rtc) {

  if (runner == nullptr)
    throw CPGDumpCtlFailure("dump operation requires a process runner");

  this->runner = runner;

  if (this->runtime_config == nullptr)
    this->runtime_config = RuntimeVariableEnvironment::createRuntimeConfiguration();

}

DumpOperation::~DumpOperation() {}

ProcessCommand DumpOperation::buildCommand(std::shared_ptr<const ConnectionConfig> connection,
                                           bfs::path outputFile,
                                           std::string executable) {

  ProcessCommand cmd;

  cmd.executable = executable;

  cmd.args.push_back("-h");
  cmd.args.push_back(connection->host);
  cmd.args.push_back("-p");
  cmd.args.push_back(CPGDumpCtlBase::intToStr(connection->port));
  cmd.args.push_back("-U");
  cmd.args.push_back(connection->user);
  cmd.args.push_back("-d");
  cmd.args.push_back(connection->dbname);
  cmd.args.push_back("--format=custom");
  cmd.args.push_back("--no-password");
  cmd.args.push_back("--file=" + outputFile.string());

  if (!connection->password.empty())
    cmd.environment["PGPASSWORD"] = connection->password;

  return cmd;

}

void DumpOperation::removeTemporary(bfs::path tmpfile) {

  boost::system::error_code ec;

  if (bfs::exists(tmpfile, ec)) {

    bfs::remove(tmpfile, ec);

    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "could not remove incomplete dump "
                               << tmpfile << ": " << ec.message();
    } else {
      BOOST_LOG_TRIVIAL(debug) << "removed incomplete dump " << tmpfile;
    }

  }

}

OperationResult DumpOperation::execute(std::shared_ptr<const ConnectionConfig> connection,
                                       JobSignalHandler *cancel) {

  OperationResult result;
  OperationResult procresult;
  boost::system::error_code ec;
  std::chrono::steady_clock::time_point start = CPGDumpCtlBase::current_hires_time_point();
  std::time_t started = std::time(NULL);
  bfs::path finalfile;
  bfs::path tmpfile;

  if (connection == nullptr)
    throw CPGDumpCtlFailure("cannot dump undefined connection");

  bfs::create_directories(connection->dumpPath, ec);

  if (ec) {
    result = OperationResult::failure(OPERR_INTERNAL,
                                      "cannot create dump directory "
                                      + connection->dumpPath.string() + ": " + ec.message());
  } else {

    /*
     * Pick a name not used by a completed or a running dump.
     */
    boost::posix_time::ptime now = boost::posix_time::second_clock::universal_time();
    unsigned int seq = 0;

    for (; seq < MAX_ARTIFACT_SEQUENCE; seq++) {

      finalfile = connection->dumpPath / DumpCatalog::makeArtifactName(connection->name, now, seq);
      tmpfile = connection->dumpPath / DumpCatalog::inProgressName(finalfile.filename().string());

      if (!bfs::exists(finalfile, ec) && !bfs::exists(tmpfile, ec))
        break;

    }

    if (seq >= MAX_ARTIFACT_SEQUENCE) {

      result = OperationResult::failure(OPERR_INTERNAL,
                                        "no unused dump file name left in "
                                        + connection->dumpPath.string());

    } else if (cancellation_requested(cancel)) {

      result = OperationResult::cancelled("dump cancelled before pg_dump was started");

    } else {

      ProcessCommand cmd = buildCommand(connection, tmpfile,
                                        this->runtime_config->getString("pg_dump.binary"));
      std::string conn_name = connection->name;

      cmd.configure(this->runtime_config);
      cmd.progress = [conn_name](const std::string &line) {
        BOOST_LOG_TRIVIAL(debug) << "pg_dump [" << conn_name << "]: " << line;
      };

      BOOST_LOG_TRIVIAL(info) << "dumping connection \"" << connection->name
                              << "\" (" << connection->describe() << ") into " << finalfile;

      try {
        procresult = this->runner->run(cmd, cancel);
      } catch (...) {
        removeTemporary(tmpfile);
        throw;
      }

      result = procresult;

      if (procresult.succeeded()) {

        if (!bfs::is_regular_file(tmpfile, ec)) {

          result.status = OPERATION_FAILED;
          result.error = OPERR_PROCESS_FAILED;
          result.message = "pg_dump exited successfully but did not write " + tmpfile.string();

        } else {

          bfs::rename(tmpfile, finalfile, ec);

          if (ec) {
            result.status = OPERATION_FAILED;
            result.error = OPERR_INTERNAL;
            result.message = "cannot rename " + tmpfile.string() + ": " + ec.message();
          } else {
            result.artifact = finalfile.string();
          }

        }

      }

      if (!result.succeeded())
        removeTemporary(tmpfile);

    }

  }

  result.action = ACTION_DUMP;
  result.connection = connection->name;
  result.started = started;
  result.durationMs = CPGDumpCtlBase::duration_get_ms(
    CPGDumpCtlBase::calculate_duration_ms(start, CPGDumpCtlBase::current_hires_time_point()));

  return result;

}
