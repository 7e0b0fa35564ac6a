/*******************************************************************************
 *
 * pg_dumpctl - dump and restore orchestration for PostgreSQL databases
 *
 ******************************************************************************/

#include <boost/log/trivial.hpp>
#include <boost/algorithm/string.hpp>

#include <iostream>
#include <string>
#include <vector>
#include <popt.h>
#include <readline/readline.h>
#include <readline/history.h>
#include <signal.h>
#include <string.h>

#include <pg_dumpctl.hxx>
#include <tab_completion.hxx>
#include <common.hxx>
#include <signalhandler.hxx>
#include <rtconfig.hxx>
#include <orchestration.hxx>
#include <output.hxx>

using namespace pgdumpctl;
using namespace std;

#define PG_DUMPCTL_SUCCESS 0
#define PG_DUMPCTL_OPERATION_FAILED 1
#define PG_DUMPCTL_CONFIG_ERROR 2
#define PG_DUMPCTL_USAGE_ERROR 3
#define PG_DUMPCTL_CANCELLED 4
#define PG_DUMPCTL_GENERIC_ERROR 255

/*
 * Invalid command or command arguments.
 */
class CCommandUsage : public CPGDumpCtlFailure {
public:
  CCommandUsage(const char *errstr) : CPGDumpCtlFailure(errstr) {};
  CCommandUsage(std::string errstr) : CPGDumpCtlFailure(errstr) {};
};

/*
 * Readline loop wants to exit?
 * Set by handle_signal.
 */
volatile sig_atomic_t wants_exit = 0;

/*
 * Set to 1 if a running operation should be cancelled.
 */
volatile sig_atomic_t command_abort_requested = 0;

/*
 * Global signal handler object, passed down to
 * dump and restore operations.
 */
AtomicSignalHandler *sigStop = new AtomicSignalHandler(&command_abort_requested, 1);

/*
 * Runtime configuration handler.
 */
std::shared_ptr<RuntimeConfiguration> RtCfg = nullptr;

/*
 * Objects wired together at startup.
 */
std::shared_ptr<ConnectionRegistry> Registry = nullptr;
std::shared_ptr<DumpCatalog> Catalog = nullptr;
std::shared_ptr<OrchestrationEngine> Engine = nullptr;

/*
 * Handle for command line arguments
 */
typedef struct PGDumpCtlArgs {
  char *configFile;
  char *action;
  char *connection;
  char *dumpFile;
  int   clean;
  int   version;
  char **variables = NULL; /* list of runtime variables to set */
} PGDumpCtlArgs;

static void handle_signal_on_input(int sig) {

  if ( (sig == SIGQUIT)
       || (sig == SIGTERM) ) {

    wants_exit = 1;
    command_abort_requested = 1;

  }

  if ( sig == SIGINT ) {

    command_abort_requested = 1;

  }

}

static void printActionHelp() {

  cout <<
    "--action supports the following commands: \n"
       << "\n"
       << "   connections: list configured connections\n"
       << "\n"
       << "   list       : list dumps of a connection (requires --connection)\n"
       << "\n"
       << "   dump       : dump a connection (requires --connection)\n"
       << "\n"
       << "   restore    : restore a dump (requires --connection and --dump-file,\n"
       << "                --clean drops all tables first)\n"
       << "\n"
       << "   history    : show the operation history (requires history.catalog)\n"
       << "\n"
       << "   help       : this screen\n"
       << "\n";

}

static void printShellHelp() {

  cout << "connections                           list configured connections" << endl
       << "list <connection>                     list dumps of a connection" << endl
       << "dump <connection>                     dump a connection" << endl
       << "restore <connection> <dump> [clean]   restore a dump, clean drops all tables first" << endl
       << "history [<connection> [<limit>]]      show the operation history" << endl
       << "set <variable> <value>                set a runtime variable" << endl
       << "show [<variable>]                     show runtime variables" << endl
       << "help                                  this screen" << endl
       << "quit                                  leave the shell" << endl;

}

/*
 * Process command line arguments
 */
static void processCmdLineArgs(int argc,
                               const char **argv,
                               PGDumpCtlArgs *handle) {
  int processedArg;

  /*
   * Make proper handle initialization.
   */
  handle->configFile = NULL;
  handle->action     = NULL;
  handle->connection = NULL;
  handle->dumpFile   = NULL;
  handle->clean      = 0;
  handle->version    = 0;

  /*
   * Set libpopt options.
   */
  poptOption options[] = {

    { "config", 'c', POPT_ARG_STRING,
      &handle->configFile, 0, PG_DUMPCTL_CONFIG },
    { "action", 'a', POPT_ARG_STRING,
      &handle->action, 0, "Action command (see --action help)" },
    { "connection", 'n', POPT_ARG_STRING,
      &handle->connection, 0, "Name of the connection" },
    { "dump-file", 'f', POPT_ARG_STRING,
      &handle->dumpFile, 0, "Dump file to restore" },
    { "clean", 'C', POPT_ARG_NONE,
      &handle->clean, 0, "drop all tables before restoring" },
    { "version", 0, POPT_ARG_NONE,
      &handle->version, 0, "print version and exit" },
    { "variable", 'V', POPT_ARG_ARGV,
      &handle->variables, 0, "runtime variables to be set during execution" },

    POPT_AUTOHELP { NULL, 0, 0, NULL, 0 }
  };

  poptContext context = poptGetContext(argv[0], argc,
                                       (const char **) argv, options, 0);

  /*
   * Process popt arguments.
   */
  processedArg = poptGetNextOpt(context);

  /*
   * Check for bad command line arguments,
   * throw a CCommandUsage exception in case
   * something is wrong.
   */
  if (processedArg < -1) {
    /* bad command line argument */
    string errstr;
    errstr = string(poptBadOption(context, POPT_BADOPTION_NOALIAS))
      + string(": ")
      + string((char *)poptStrerror(processedArg));
    poptFreeContext(context);
    throw CCommandUsage(errstr);
  }

  poptFreeContext(context);

}

/*
 * Build runtime configuration.
 */
static void init_RtCfg() {

  RtCfg = RuntimeVariableEnvironment::createRuntimeConfiguration();

  /*
   * The log_level parameter tells pg_dumpctl what to log.
   */
  std::shared_ptr<ConfigVariable> log_level = RtCfg->get("logging.level");

  log_level->set_assign_hook(CPGDumpCtlBase::set_log_severity);
  log_level->reassign();

}

static bool on_error_exit() {

  return RtCfg->getBool("interactive.on_error_exit");

}

/*
 * Opens the history catalog named by history.catalog and attaches
 * it to the engine, or detaches it if the variable is empty.
 */
static void refresh_history() {

  std::string catalog = RtCfg->getString("history.catalog");
  std::shared_ptr<OperationHistory> current = Engine->getHistory();

  if (catalog.empty()) {
    Engine->attachHistory(nullptr);
    return;
  }

  if (current != nullptr && current->fullname() == catalog)
    return;

  std::shared_ptr<OperationHistory> history = std::make_shared<OperationHistory>(catalog);

  history->open_rw();
  Engine->attachHistory(history);

  BOOST_LOG_TRIVIAL(debug) << "recording operation history in " << catalog;

}

static int exitCodeFor(const OperationResult &result) {

  switch(result.status) {
  case OPERATION_SUCCEEDED:
    return PG_DUMPCTL_SUCCESS;
  case OPERATION_CANCELLED:
    return PG_DUMPCTL_CANCELLED;
  default:
    return PG_DUMPCTL_OPERATION_FAILED;
  }

}

static void requireArgs(std::vector<std::string> &words,
                        size_t min, size_t max,
                        std::string usage) {

  if (words.size() < min || words.size() > max)
    throw CCommandUsage("usage: " + usage);

}

/*
 * Executes a single command given as words, prints its output
 * and returns the exit code.
 */
static int executeCommand(std::vector<std::string> words) {

  std::shared_ptr<OutputFormatter> formatter = OutputFormatter::formatter(RtCfg);
  std::ostringstream output;
  std::string command;
  int rc = PG_DUMPCTL_SUCCESS;

  if (words.empty())
    return rc;

  command = boost::algorithm::to_lower_copy(words[0]);

  /*
   * Operations observe the flag, make sure a previous
   * interrupt doesn't cancel this one.
   */
  command_abort_requested = 0;

  try {

    if (command == "connections") {

      requireArgs(words, 1, 1, "connections");
      formatter->nodeAs(Engine->connections(), output);

    } else if (command == "list") {

      requireArgs(words, 2, 2, "list <connection>");

      std::vector<DumpArtifact> dumps = Engine->listDumps(words[1]);
      formatter->nodeAs(words[1], dumps, output);

    } else if (command == "dump") {

      requireArgs(words, 2, 2, "dump <connection>");

      OperationResult result = Engine->dump(words[1], sigStop);

      formatter->nodeAs(result, output);
      rc = exitCodeFor(result);

    } else if (command == "restore") {

      bool clean = false;

      requireArgs(words, 3, 4, "restore <connection> <dump> [clean]");

      if (words.size() == 4) {

        if (!boost::iequals(words[3], "clean"))
          throw CCommandUsage("usage: restore <connection> <dump> [clean]");

        clean = true;

      }

      OperationResult result = Engine->restore(words[1], words[2], clean, sigStop);

      formatter->nodeAs(result, output);
      rc = exitCodeFor(result);

    } else if (command == "history") {

      std::string connection = "";
      unsigned int limit = 20;

      requireArgs(words, 1, 3, "history [<connection> [<limit>]]");

      if (Engine->getHistory() == nullptr)
        throw CCommandUsage("operation history disabled, set history.catalog first");

      if (words.size() > 1) {

        /* verifies the name */
        connection = Registry->get(words[1])->name;

      }

      if (words.size() > 2) {

        int value;

        try {
          value = CPGDumpCtlBase::strToInt(words[2]);
        } catch (CPGDumpCtlFailure &e) {
          throw CCommandUsage("invalid history limit \"" + words[2] + "\"");
        }

        if (value <= 0)
          throw CCommandUsage("history limit must be positive");

        limit = (unsigned int) value;

      }

      std::vector<HistoryEntry> entries = Engine->getHistory()->list(connection, limit);
      formatter->nodeAs(entries, output);

    } else if (command == "set") {

      std::shared_ptr<ConfigVariable> var;

      requireArgs(words, 3, 3, "set <variable> <value>");

      try {
        var = RtCfg->assign(words[1], words[2]);
      } catch (CPGDumpCtlFailure &e) {
        throw CCommandUsage(e.what());
      }

      if (words[1] == "history.catalog")
        refresh_history();

      /* the output format might have changed */
      formatter = OutputFormatter::formatter(RtCfg);
      formatter->nodeAs(var, output);

    } else if (command == "show") {

      requireArgs(words, 1, 2, "show [<variable>]");

      if (words.size() == 2) {

        std::shared_ptr<ConfigVariable> var;

        try {
          var = RtCfg->get(words[1]);
        } catch (CPGDumpCtlFailure &e) {
          throw CCommandUsage(e.what());
        }

        formatter->nodeAs(var, output);

      } else {
        formatter->nodeAs(RtCfg, output);
      }

    } else if (command == "help") {

      printShellHelp();

    } else {

      throw CCommandUsage("unknown command: " + words[0]);

    }

  } catch (CCommandUsage &e) {

    OutputFormatter::nodeAs(e, output, RtCfg->getString("output.format"));
    rc = PG_DUMPCTL_USAGE_ERROR;

  } catch (CPGDumpCtlFailure &e) {

    /* unknown connection, history failures et al. */
    OutputFormatter::nodeAs(e, output, RtCfg->getString("output.format"));
    rc = PG_DUMPCTL_OPERATION_FAILED;

  }

  cout << output.str();
  return rc;

}

/*
 * Maps --action and its options to a command.
 */
static int executeAction(PGDumpCtlArgs *args) {

  std::vector<std::string> words;
  std::string action = args->action;

  if (action == "help") {
    printActionHelp();
    return PG_DUMPCTL_SUCCESS;
  }

  words.push_back(action);

  if (action == "list" || action == "dump" || action == "restore") {

    if (args->connection == NULL)
      throw CCommandUsage("--connection required for action \"" + action + "\"");

    words.push_back(args->connection);

  }

  if (action == "restore") {

    if (args->dumpFile == NULL)
      throw CCommandUsage("--dump-file required for action \"restore\"");

    words.push_back(args->dumpFile);

    if (args->clean > 0)
      words.push_back("clean");

  } else if (args->clean > 0) {
    throw CCommandUsage("--clean is only valid for action \"restore\"");
  }

  if (action == "history" && args->connection != NULL)
    words.push_back(args->connection);

  if (action != "connections" && action != "list" && action != "dump"
      && action != "restore" && action != "history") {
    throw CCommandUsage("unknown action: " + action);
  }

  return executeCommand(words);

}

static std::vector<std::string> splitCommand(std::string input) {

  std::vector<std::string> words;
  std::vector<std::string> result;

  boost::algorithm::trim(input);

  /* a trailing ';' is accepted for convenience */
  if (!input.empty() && input.back() == ';')
    input.pop_back();

  boost::split(words, input, boost::is_any_of(" \t"), boost::token_compress_on);

  for (auto &word : words) {
    if (!word.empty())
      result.push_back(word);
  }

  return result;

}

/*
 * Entry point for interactive commands.
 */
static int handle_interactive() {

  char *cmd_str = NULL;
  int rc = PG_DUMPCTL_SUCCESS;

  /* prepare readline support */
  init_readline(Registry, Catalog, RtCfg);

  cout << CPGDumpCtlBase::getVersionString() << ", type \"help\" for commands" << endl;

  while (!wants_exit
         && (cmd_str = readline("pg_dumpctl> ")) != NULL) {

    std::string input(cmd_str);
    std::vector<std::string> words = splitCommand(input);

    free(cmd_str);
    step_readline();

    if (words.empty())
      continue;

    /*
     * Push the requested command into history
     */
    add_history(input.c_str());

    if (boost::iequals(words[0], "quit") || boost::iequals(words[0], "exit"))
      break;

    rc = executeCommand(words);

    /*
     * Check if runtime configuration variable interactive.on_error_exit
     * was set to TRUE. If yes, leave with the command's exit code.
     */
    if (rc != PG_DUMPCTL_SUCCESS && on_error_exit())
      return rc;

  }

  if (wants_exit)
    cout << "quit" << endl;

  return PG_DUMPCTL_SUCCESS;

}

int main(int argc, const char **argv) {

  PGDumpCtlArgs args;
  struct sigaction sa;

  /*
   * Signals only set flags. SA_RESTART is left out so a
   * blocking call returns early, child processes are reaped by
   * the process runner itself.
   */
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handle_signal_on_input;
  sigemptyset(&sa.sa_mask);

  if (sigaction(SIGINT, &sa, NULL) < 0
      || sigaction(SIGTERM, &sa, NULL) < 0
      || sigaction(SIGQUIT, &sa, NULL) < 0) {
    BOOST_LOG_TRIVIAL(error) << "error setting up signal handlers";
    exit(PG_DUMPCTL_GENERIC_ERROR);
  }

  try {

    /**
     * Build map of runtime parameters.
     */
    init_RtCfg();

    /*
     * Process command line arguments.
     */
    processCmdLineArgs(argc, argv, &args);

    if (args.version > 0) {
      cout << CPGDumpCtlBase::getVersionString() << endl;
      exit(PG_DUMPCTL_SUCCESS);
    }

    if (args.variables != NULL) {

      for (char **var = args.variables; *var != NULL; var++) {

        try {
          RtCfg->assign(std::string(*var));
        } catch (CPGDumpCtlFailure &e) {
          throw CCommandUsage(std::string("--variable: ") + e.what());
        }

      }

    }

    /*
     * Configuration file required, if not use compiled in default.
     */
    if (args.configFile == NULL) {
      args.configFile = (char *) PG_DUMPCTL_CONFIG;
      BOOST_LOG_TRIVIAL(debug) << "--config not specified, using " << args.configFile;
    }

    try {

      Registry = ConnectionConfigLoader::registry(boost::filesystem::path(args.configFile));

    } catch (CConnectionConfigIssue &e) {

      BOOST_LOG_TRIVIAL(error) << "configuration error: " << e.what();
      exit(PG_DUMPCTL_CONFIG_ERROR);

    }

    Catalog = std::make_shared<DumpCatalog>();
    Engine = std::make_shared<OrchestrationEngine>(Registry,
                                                   Catalog,
                                                   std::make_shared<LocalProcessRunner>(),
                                                   std::make_shared<PGSchemaWiper>(RtCfg),
                                                   RtCfg);

    try {
      refresh_history();
    } catch (CHistoryIssue &e) {
      BOOST_LOG_TRIVIAL(error) << "configuration error: " << e.what();
      exit(PG_DUMPCTL_CONFIG_ERROR);
    }

    /*
     * --action has precedence over interactive command
     * line processing via readline.
     */
    if (args.action != NULL) {
      exit(executeAction(&args));
    }

    exit(handle_interactive());

  } catch (CCommandUsage &e) {
    BOOST_LOG_TRIVIAL(error) << e.what();
    exit(PG_DUMPCTL_USAGE_ERROR);
  } catch (exception& e) {
    BOOST_LOG_TRIVIAL(error) << e.what();
    exit(PG_DUMPCTL_GENERIC_ERROR);
  }

  exit(PG_DUMPCTL_SUCCESS);

}
