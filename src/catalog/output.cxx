#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/algorithm/string/join.hpp>
#include <vector>

#include <common.hxx>
#include <output.hxx>

using namespace pgdumpctl;
using std::endl;

/* ****************************************************************************
 * Implementation of OutputFormatter
 * ****************************************************************************/

OutputFormatter::OutputFormatter(std::shared_ptr<RuntimeConfiguration> config) {

  /* We throw immediatly if there's no valid output config */
  if (config == nullptr)
    throw CPGDumpCtlFailure("formatter instances need a valid format config");

  this->config = config;

}

OutputFormatter::~OutputFormatter() {}

std::shared_ptr<OutputFormatter> OutputFormatter::formatter(std::shared_ptr<RuntimeConfiguration> config) {

  if (config == nullptr)
    throw CPGDumpCtlFailure("formatter instances need a valid format config");

  if (config->getString("output.format") == "json")
    return formatter(config, OUTPUT_JSON);

  return formatter(config, OUTPUT_CONSOLE);

}

std::shared_ptr<OutputFormatter> OutputFormatter::formatter(std::shared_ptr<RuntimeConfiguration> config,
                                                            OutputFormatType type) {

  std::shared_ptr<OutputFormatter> formatter = nullptr;

  switch(type) {

  case OUTPUT_CONSOLE:

    formatter = std::make_shared<ConsoleOutputFormatter>(config);
    break;

  case OUTPUT_JSON:

    formatter = std::make_shared<JsonOutputFormatter>(config);
    break;

  }

  return formatter;

}

void OutputFormatter::nodeAs(std::exception &e,
                             std::ostringstream &output,
                             std::string output_type) {

  namespace pt = boost::property_tree;

  if (output_type == "json") {
    pt::ptree head;

    head.put("severity", "error");
    head.put("message", e.what());
    pt::write_json(output, head);
  } else {
    output << "ERROR: " << e.what() << endl;
  }

}

/* ****************************************************************************
 * Implementation of ConsoleOutputFormatter
 * ****************************************************************************/

ConsoleOutputFormatter::ConsoleOutputFormatter(std::shared_ptr<RuntimeConfiguration> config)
  : OutputFormatter(config) {}

ConsoleOutputFormatter::~ConsoleOutputFormatter() {}

void ConsoleOutputFormatter::nodeAs(std::string connection,
                                    std::vector<DumpArtifact> &list,
                                    std::ostringstream &output) {

  output << CPGDumpCtlBase::makeHeader("Dumps of connection " + connection,
                                       boost::format("%-45s\t%-19s\t%-12s") % "Dump" % "Created" % "Size",
                                       90);

  for (auto &artifact : list) {

    output << CPGDumpCtlBase::makeLine(boost::format("%-45s\t%-19s\t%-12s")
                                       % artifact.id
                                       % CPGDumpCtlBase::time_to_str(artifact.createdAt)
                                       % CPGDumpCtlBase::prettySize(artifact.sizeBytes));

  }

  output << CPGDumpCtlBase::makeLine(90) << endl;
  output << list.size() << " dump(s)" << endl;

}

void ConsoleOutputFormatter::nodeAs(const OperationResult &result,
                                    std::ostringstream &output) {

  std::string status = OperationResult::statusName(result.status);

  if (result.succeeded())
    status = CPGDumpCtlBase::stdout_green(status, true);
  else
    status = CPGDumpCtlBase::stdout_red(status, true);

  output << CPGDumpCtlBase::makeHeader(OperationResult::actionName(result.action)
                                       + " of connection " + result.connection,
                                       boost::format("%-20s\t%-60s") % "Property" % "Value",
                                       80);

  output << CPGDumpCtlBase::makeLine(boost::format("%-20s\t%-60s") % "Status" % status);

  if (!result.succeeded()) {
    output << CPGDumpCtlBase::makeLine(boost::format("%-20s\t%-60s")
                                       % "Error" % OperationResult::errorName(result.error));
    output << CPGDumpCtlBase::makeLine(boost::format("%-20s\t%-60s")
                                       % "Message" % result.message);
  }

  if (!result.artifact.empty())
    output << CPGDumpCtlBase::makeLine(boost::format("%-20s\t%-60s") % "Artifact" % result.artifact);

  if (result.exitCode >= 0)
    output << CPGDumpCtlBase::makeLine(boost::format("%-20s\t%-60s") % "Exit code" % result.exitCode);

  output << CPGDumpCtlBase::makeLine(boost::format("%-20s\t%-60s")
                                     % "Started" % CPGDumpCtlBase::time_to_str(result.started));
  output << CPGDumpCtlBase::makeLine(boost::format("%-20s\t%-60s")
                                     % "Duration (ms)" % result.durationMs);

  if (!result.succeeded() && !result.stderrTail.empty()) {
    output << CPGDumpCtlBase::makeLine(80) << endl;
    output << "stderr:" << endl << result.stderrTail;

    if (result.stderrTail.back() != '\n')
      output << endl;
  }

}

void ConsoleOutputFormatter::nodeAs(std::vector<std::shared_ptr<const ConnectionConfig>> connections,
                                    std::ostringstream &output) {

  output << "List of connections" << endl;

  for (auto &con : connections) {

    /* item header */
    output << CPGDumpCtlBase::makeHeader("connection " + con->name,
                                         boost::format("%-15s\t%-60s") % "Attribute" % "Setting",
                                         80) << endl;
    output << boost::format("%-15s\t%-60s") % "PGHOST" % con->host << endl;
    output << boost::format("%-15s\t%-60s") % "PGPORT" % con->port << endl;
    output << boost::format("%-15s\t%-60s") % "PGDATABASE" % con->dbname << endl;
    output << boost::format("%-15s\t%-60s") % "PGUSER" % con->user << endl;
    output << boost::format("%-15s\t%-60s") % "DUMP PATH" % con->dumpPath.string() << endl;
    output << boost::format("%-15s\t%-60s") % "RESTORE"
      % (con->preventRestore ? "DISABLED" : "ALLOWED") << endl;

    if (!con->wipeSchemas.empty()) {
      output << boost::format("%-15s\t%-60s") % "WIPE SCHEMAS"
        % boost::algorithm::join(con->wipeSchemas, ", ") << endl;
    }

  }

}

void ConsoleOutputFormatter::nodeAs(std::vector<HistoryEntry> &entries,
                                    std::ostringstream &output) {

  output << CPGDumpCtlBase::makeHeader("Operation history",
                                       boost::format("%-6s\t%-19s\t%-12s\t%-8s\t%-10s\t%-40s")
                                       % "ID" % "Started" % "Connection" % "Action" % "Status" % "Artifact/Message",
                                       120);

  for (auto &entry : entries) {

    output << CPGDumpCtlBase::makeLine(boost::format("%-6s\t%-19s\t%-12s\t%-8s\t%-10s\t%-40s")
                                       % entry.id
                                       % entry.started
                                       % entry.connection
                                       % entry.action
                                       % entry.status
                                       % ((entry.status == "succeeded") ? entry.artifact : entry.message));

  }

}

void ConsoleOutputFormatter::nodeAs(std::shared_ptr<RuntimeConfiguration> rtc,
                                    std::ostringstream &output) {

  output << CPGDumpCtlBase::makeHeader("Runtime Variables",
                                       boost::format("%-30s\t%-40s") % "Name" % "Value",
                                       80);

  for (auto &name : rtc->names()) {

    std::shared_ptr<ConfigVariable> var = rtc->get(name);
    std::string str_value;

    var->getValue(str_value);

    output << boost::format("%-30s | %-40s") % var->getName() % str_value
           << endl;

  }

}

void ConsoleOutputFormatter::nodeAs(std::shared_ptr<ConfigVariable> var,
                                    std::ostringstream &output) {

  std::string str_value;

  /* extract value */
  var->getValue(str_value);

  output << CPGDumpCtlBase::makeHeader("Runtime Variables",
                                       boost::format("%-30s\t%-40s") % "Name" % "Value",
                                       80);
  output << boost::format("%-30s | %-40s") % var->getName() % str_value
         << endl;

}

/* ****************************************************************************
 * Implementation of JsonOutputFormatter
 * ****************************************************************************/

JsonOutputFormatter::JsonOutputFormatter(std::shared_ptr<RuntimeConfiguration> config)
  : OutputFormatter(config) {}

JsonOutputFormatter::~JsonOutputFormatter() {}

void JsonOutputFormatter::nodeAs(std::string connection,
                                 std::vector<DumpArtifact> &list,
                                 std::ostringstream &output) {

  namespace pt = boost::property_tree;

  pt::ptree head;
  pt::ptree dumps;

  head.put("connection", connection);
  head.put("num_dumps", list.size());

  for (auto &artifact : list) {

    pt::ptree item;

    item.put("id", artifact.id);
    item.put("name", artifact.displayName);
    item.put("path", artifact.path.string());
    item.put("created", CPGDumpCtlBase::time_to_str(artifact.createdAt));
    item.put("size", artifact.sizeBytes);

    dumps.push_back(std::make_pair("", item));

  }

  head.add_child("dumps", dumps);
  pt::write_json(output, head);

}

boost::property_tree::ptree JsonOutputFormatter::toPtree(const OperationResult &result) {

  boost::property_tree::ptree node;

  node.put("action", OperationResult::actionName(result.action));
  node.put("connection", result.connection);
  node.put("status", OperationResult::statusName(result.status));
  node.put("error", OperationResult::errorName(result.error));
  node.put("message", result.message);
  node.put("artifact", result.artifact);
  node.put("exit_code", result.exitCode);
  node.put("started", CPGDumpCtlBase::time_to_str(result.started));
  node.put("duration_ms", result.durationMs);
  node.put("stderr", result.stderrTail);

  return node;

}

void JsonOutputFormatter::nodeAs(const OperationResult &result,
                                 std::ostringstream &output) {

  namespace pt = boost::property_tree;

  pt::ptree head;

  head.add_child("result", toPtree(result));
  pt::write_json(output, head);

}

void JsonOutputFormatter::nodeAs(std::vector<std::shared_ptr<const ConnectionConfig>> connections,
                                 std::ostringstream &output) {

  namespace pt = boost::property_tree;

  pt::ptree head;
  pt::ptree clist; /* makes up json array for connection info */

  head.put("num_connections", connections.size());

  for (auto &con : connections) {

    pt::ptree item;
    pt::ptree schemas;

    item.put("name", con->name);
    item.put("hostname", con->host);
    item.put("port", con->port);
    item.put("dbname", con->dbname);
    item.put("user", con->user);
    item.put("dump_path", con->dumpPath.string());
    item.put("prevent_restore", con->preventRestore);

    for (auto &schema : con->wipeSchemas) {
      pt::ptree value;
      value.put("", schema);
      schemas.push_back(std::make_pair("", value));
    }

    item.add_child("wipe_schemas", schemas);
    clist.push_back(std::make_pair("", item));

  }

  head.add_child("connections", clist);
  pt::write_json(output, head);

}

void JsonOutputFormatter::nodeAs(std::vector<HistoryEntry> &entries,
                                 std::ostringstream &output) {

  namespace pt = boost::property_tree;

  pt::ptree head;
  pt::ptree list;

  head.put("num_entries", entries.size());

  for (auto &entry : entries) {

    pt::ptree item;

    item.put("id", entry.id);
    item.put("connection", entry.connection);
    item.put("action", entry.action);
    item.put("artifact", entry.artifact);
    item.put("status", entry.status);
    item.put("error", entry.error);
    item.put("exit_code", entry.exitCode);
    item.put("duration_ms", entry.durationMs);
    item.put("started", entry.started);
    item.put("message", entry.message);

    list.push_back(std::make_pair("", item));

  }

  head.add_child("history", list);
  pt::write_json(output, head);

}

void JsonOutputFormatter::nodeAs(std::shared_ptr<RuntimeConfiguration> rtc,
                                 std::ostringstream &output) {

  namespace pt = boost::property_tree;

  pt::ptree head;
  pt::ptree variables;

  head.put("number of variables", rtc->count_variables());

  for (auto &name : rtc->names()) {

    pt::ptree item;
    std::string str_value;

    rtc->get(name)->getValue(str_value);

    item.put("name", name);
    item.put("value", str_value);

    variables.push_back(std::make_pair("", item));

  }

  head.add_child("variables", variables);
  pt::write_json(output, head);

}

void JsonOutputFormatter::nodeAs(std::shared_ptr<ConfigVariable> var,
                                 std::ostringstream &output) {

  namespace pt = boost::property_tree;

  pt::ptree head;
  pt::ptree item;
  std::string str_value;

  var->getValue(str_value);
  item.put("name", var->getName());
  item.put("value", str_value);

  head.add_child("config variable", item);
  pt::write_json(output, head);

}
