#include <fstream>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

#include <connections.hxx>

using namespace pgdumpctl;

/* ****************************************************************************
 * ConnectionConfig
 * ****************************************************************************/

std::string ConnectionConfig::describe() const {

  std::ostringstream oss;

  oss << "host=" << this->host
      << " port=" << this->port
      << " dbname=" << this->dbname
      << " user=" << this->user;

  return oss.str();

}

void ConnectionConfig::validate() const {

  if (this->name.empty())
    throw CConnectionConfigIssue("connection name must not be empty");

  /*
   * The name becomes part of every dump file name, so it must
   * not be able to escape the dump directory. A leading dot
   * would turn its dumps into hidden files the catalog skips.
   */
  if (this->name.find('/') != std::string::npos
      || this->name[0] == '.') {
    throw CConnectionConfigIssue("invalid connection name \"" + this->name + "\"");
  }

  if (this->dbname.empty())
    throw CConnectionConfigIssue("connection \"" + this->name + "\": dbname is required");

  if (this->dumpPath.empty())
    throw CConnectionConfigIssue("connection \"" + this->name + "\": dump_path is required");

  if (this->port < 1 || this->port > 65535) {
    std::ostringstream oss;
    oss << "connection \"" << this->name << "\": port " << this->port << " out of range";
    throw CConnectionConfigIssue(oss.str());
  }

}

/* ****************************************************************************
 * ConnectionRegistry
 * ****************************************************************************/

ConnectionRegistry::ConnectionRegistry(std::vector<ConnectionConfig> configs) {

  for (auto &config : configs) {

    config.validate();

    if (this->by_name.find(config.name) != this->by_name.end()) {
      throw CConnectionConfigIssue("duplicate connection name \"" + config.name + "\"");
    }

    std::shared_ptr<const ConnectionConfig> entry
      = std::make_shared<const ConnectionConfig>(config);

    this->connections.push_back(entry);
    this->by_name.insert(std::make_pair(entry->name, entry));

  }

}

ConnectionRegistry::~ConnectionRegistry() {}

std::shared_ptr<const ConnectionConfig> ConnectionRegistry::get(std::string name) const {

  auto it = this->by_name.find(name);

  if (it == this->by_name.end())
    throw CUnknownConnection("unknown connection \"" + name + "\"");

  return it->second;

}

bool ConnectionRegistry::exists(std::string name) const {

  return (this->by_name.find(name) != this->by_name.end());

}

std::vector<std::shared_ptr<const ConnectionConfig>> ConnectionRegistry::list() const {

  return this->connections;

}

std::vector<std::string> ConnectionRegistry::names() const {

  std::vector<std::string> result;

  for (auto const &entry : this->connections) {
    result.push_back(entry->name);
  }

  return result;

}

size_t ConnectionRegistry::size() const {

  return this->connections.size();

}

/* ****************************************************************************
 * ConnectionConfigLoader
 * ****************************************************************************/

std::string ConnectionConfigLoader::unquote(std::string value) {

  boost::algorithm::trim(value);

  /* Accept TOML style quoted strings as well */
  if (value.length() >= 2
      && ((value.front() == '"' && value.back() == '"')
          || (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.length() - 2);
  }

  return value;

}

boost::filesystem::path ConnectionConfigLoader::expandHome(std::string value) {

  if (value == "~" || boost::algorithm::starts_with(value, "~/")) {

    char *home = getenv("HOME");

    if (home == NULL)
      throw CConnectionConfigIssue("cannot expand \"" + value + "\": HOME is not set");

    return boost::filesystem::path(std::string(home) + value.substr(1));

  }

  return boost::filesystem::path(value);

}

std::vector<ConnectionConfig> ConnectionConfigLoader::load(boost::filesystem::path configFile) {

  std::ifstream in(configFile.string());

  if (!in.is_open()) {
    throw CConnectionConfigIssue("cannot open connection configuration file "
                                 + configFile.string());
  }

  return load(in, configFile.string());

}

std::vector<ConnectionConfig> ConnectionConfigLoader::load(std::istream &in,
                                                           std::string source) {

  namespace pt = boost::property_tree;

  pt::ptree tree;
  std::vector<ConnectionConfig> result;

  try {
    pt::ini_parser::read_ini(in, tree);
  } catch (pt::ini_parser_error &e) {
    std::ostringstream oss;
    oss << source << ":" << e.line() << ": " << e.message();
    throw CConnectionConfigIssue(oss.str());
  }

  for (auto const &section : tree) {

    ConnectionConfig config;
    std::string section_name = section.first;

    /*
     * A key outside of any section has no children but data
     * attached.
     */
    if (section.second.empty() && !section.second.data().empty()) {
      throw CConnectionConfigIssue(source + ": key \"" + section_name
                                   + "\" outside of a connection section");
    }

    /* [connections.main] is the layout of the former TOML configuration */
    if (boost::algorithm::starts_with(section_name, "connections.")) {
      section_name = section_name.substr(std::string("connections.").length());
    }

    config.name = section_name;

    for (auto const &item : section.second) {

      std::string key = item.first;
      std::string value = unquote(item.second.data());

      try {

        if (key == "host") {
          config.host = value;
        } else if (key == "port") {
          config.port = CPGDumpCtlBase::strToInt(value);
        } else if (key == "dbname") {
          config.dbname = value;
        } else if (key == "user") {
          config.user = value;
        } else if (key == "password") {
          config.password = value;
        } else if (key == "dump_path") {
          config.dumpPath = expandHome(value);
        } else if (key == "prevent_restore") {
          config.preventRestore = CPGDumpCtlBase::strToBool(value);
        } else if (key == "wipe_schemas") {

          std::vector<std::string> schemas;

          boost::split(schemas, value, boost::is_any_of(","));

          for (auto &schema : schemas) {
            boost::algorithm::trim(schema);

            if (!schema.empty())
              config.wipeSchemas.push_back(unquote(schema));
          }

        } else {
          BOOST_LOG_TRIVIAL(warning) << source << ": ignoring unknown key \""
                                     << key << "\" in connection \"" << config.name << "\"";
        }

      } catch (CConnectionConfigIssue &e) {
        throw;
      } catch (CPGDumpCtlFailure &e) {
        throw CConnectionConfigIssue(source + ": connection \"" + config.name
                                     + "\", key \"" + key + "\": " + e.what());
      }

    }

    try {
      config.validate();
    } catch (CConnectionConfigIssue &e) {
      throw CConnectionConfigIssue(source + ": " + e.what());
    }

    result.push_back(config);

  }

  return result;

}

std::shared_ptr<ConnectionRegistry> ConnectionConfigLoader::registry(boost::filesystem::path configFile) {

  return std::make_shared<ConnectionRegistry>(load(configFile));

}
