#ifndef __HAVE_CONNECTIONS_HXX__
#define __HAVE_CONNECTIONS_HXX__

#include <istream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <common.hxx>

namespace pgdumpctl {

  /**
   * Raised while reading or validating connection
   * configuration.
   */
  class CConnectionConfigIssue : public CPGDumpCtlFailure {
  public:
    CConnectionConfigIssue(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    CConnectionConfigIssue(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

  /**
   * Lookup of a connection name not present in
   * the registry.
   */
  class CUnknownConnection : public CPGDumpCtlFailure {
  public:
    CUnknownConnection(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    CUnknownConnection(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

  /**
   * Descriptor of a named database connection together
   * with its dump directory and restore policy.
   */
  class ConnectionConfig {
  public:

    std::string name = "";
    std::string host = "localhost";
    int port = 5432;
    std::string dbname = "";
    std::string user = "postgres";
    std::string password = "";

    /* Directory holding the dump artifacts of this connection */
    boost::filesystem::path dumpPath;

    /* If set, any restore against this connection is rejected */
    bool preventRestore = false;

    /*
     * Schemas wiped before a clean restore. Empty means
     * all non-system schemas.
     */
    std::vector<std::string> wipeSchemas;

    /**
     * Returns a printable description of the connection
     * target. Never includes the password.
     */
    std::string describe() const;

    /**
     * Throws CConnectionConfigIssue if mandatory
     * properties are missing or malformed.
     */
    void validate() const;

  };

  /**
   * Immutable set of named connection configurations.
   *
   * Entries are handed out as shared pointers to const
   * descriptors and keep the order they were configured in.
   */
  class ConnectionRegistry {
  private:

    std::vector<std::shared_ptr<const ConnectionConfig>> connections;
    std::unordered_map<std::string, std::shared_ptr<const ConnectionConfig>> by_name;

  public:

    /**
     * Builds the registry. Every config is validated, duplicate
     * names are rejected with CConnectionConfigIssue.
     */
    ConnectionRegistry(std::vector<ConnectionConfig> configs);
    virtual ~ConnectionRegistry();

    /**
     * Returns the named connection, throws CUnknownConnection
     * if there is none.
     */
    std::shared_ptr<const ConnectionConfig> get(std::string name) const;

    bool exists(std::string name) const;

    std::vector<std::shared_ptr<const ConnectionConfig>> list() const;
    std::vector<std::string> names() const;
    size_t size() const;

  };

  /**
   * Reads connection configurations from an INI style file,
   * one section per connection:
   *
   * [main]
   * host = localhost
   * port = 5432
   * dbname = app
   * user = postgres
   * password = secret
   * dump_path = ~/dumps/main
   * prevent_restore = false
   * wipe_schemas = public, audit
   */
  class ConnectionConfigLoader {
  private:

    static std::string unquote(std::string value);
    static boost::filesystem::path expandHome(std::string value);

  public:

    static std::vector<ConnectionConfig> load(boost::filesystem::path configFile);
    static std::vector<ConnectionConfig> load(std::istream &in,
                                              std::string source);

    /**
     * Shortcut: load and wrap into a registry.
     */
    static std::shared_ptr<ConnectionRegistry> registry(boost::filesystem::path configFile);

  };

}

#endif
