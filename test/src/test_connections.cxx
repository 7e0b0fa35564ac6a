#define BOOST_TEST_MODULE TestConnections
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <connections.hxx>

using namespace pgdumpctl;

BOOST_AUTO_TEST_CASE(TestConnectionConfigLoad)
{

  std::istringstream in(
    "[main]\n"
    "host = db1.example.com\n"
    "port = 5433\n"
    "dbname = app\n"
    "user = backup\n"
    "password = \"s3cret\"\n"
    "dump_path = /var/lib/dumps/main\n"
    "\n"
    "[connections.staging]\n"
    "dbname = app_staging\n"
    "dump_path = /var/lib/dumps/staging\n"
    "prevent_restore = true\n"
    "wipe_schemas = public, audit\n");

  std::vector<ConnectionConfig> configs;

  /* 1 Two sections, two connections */
  BOOST_REQUIRE_NO_THROW( configs = ConnectionConfigLoader::load(in, "test.conf") );
  BOOST_REQUIRE( configs.size() == 2 );

  /* 2 Explicit values, quotes removed */
  BOOST_CHECK( configs[0].name == "main" );
  BOOST_CHECK( configs[0].host == "db1.example.com" );
  BOOST_CHECK( configs[0].port == 5433 );
  BOOST_CHECK( configs[0].dbname == "app" );
  BOOST_CHECK( configs[0].user == "backup" );
  BOOST_CHECK( configs[0].password == "s3cret" );
  BOOST_CHECK( configs[0].dumpPath == boost::filesystem::path("/var/lib/dumps/main") );
  BOOST_CHECK( !configs[0].preventRestore );
  BOOST_CHECK( configs[0].wipeSchemas.empty() );

  /* 3 Defaults and the connections. prefix */
  BOOST_CHECK( configs[1].name == "staging" );
  BOOST_CHECK( configs[1].host == "localhost" );
  BOOST_CHECK( configs[1].port == 5432 );
  BOOST_CHECK( configs[1].user == "postgres" );
  BOOST_CHECK( configs[1].password == "" );
  BOOST_CHECK( configs[1].preventRestore );
  BOOST_REQUIRE( configs[1].wipeSchemas.size() == 2 );
  BOOST_CHECK( configs[1].wipeSchemas[0] == "public" );
  BOOST_CHECK( configs[1].wipeSchemas[1] == "audit" );

  /* 4 Password is never part of the description */
  BOOST_CHECK( configs[0].describe().find("s3cret") == std::string::npos );

}

BOOST_AUTO_TEST_CASE(TestConnectionConfigInvalid)
{

  /* 1 dbname missing */
  std::istringstream no_db("[main]\ndump_path = /tmp/dumps\n");
  BOOST_CHECK_THROW( ConnectionConfigLoader::load(no_db, "test.conf"),
                     CConnectionConfigIssue );

  /* 2 dump_path missing */
  std::istringstream no_path("[main]\ndbname = app\n");
  BOOST_CHECK_THROW( ConnectionConfigLoader::load(no_path, "test.conf"),
                     CConnectionConfigIssue );

  /* 3 port not a number */
  std::istringstream bad_port("[main]\ndbname = app\ndump_path = /tmp\nport = abc\n");
  BOOST_CHECK_THROW( ConnectionConfigLoader::load(bad_port, "test.conf"),
                     CConnectionConfigIssue );

  /* 4 port out of range */
  std::istringstream big_port("[main]\ndbname = app\ndump_path = /tmp\nport = 70000\n");
  BOOST_CHECK_THROW( ConnectionConfigLoader::load(big_port, "test.conf"),
                     CConnectionConfigIssue );

  /* 5 prevent_restore not a boolean */
  std::istringstream bad_bool("[main]\ndbname = app\ndump_path = /tmp\nprevent_restore = sometimes\n");
  BOOST_CHECK_THROW( ConnectionConfigLoader::load(bad_bool, "test.conf"),
                     CConnectionConfigIssue );

  /* 6 key outside of a section */
  std::istringstream no_section("dbname = app\n");
  BOOST_CHECK_THROW( ConnectionConfigLoader::load(no_section, "test.conf"),
                     CConnectionConfigIssue );

  /* 7 missing file */
  BOOST_CHECK_THROW( ConnectionConfigLoader::load(boost::filesystem::path("/no/such/pg_dumpctl.conf")),
                     CConnectionConfigIssue );

}

BOOST_AUTO_TEST_CASE(TestConnectionRegistry)
{

  std::vector<ConnectionConfig> configs;
  ConnectionConfig main;
  ConnectionConfig staging;
  std::shared_ptr<ConnectionRegistry> registry = nullptr;

  main.name = "main";
  main.dbname = "app";
  main.dumpPath = "/tmp/dumps/main";

  staging.name = "staging";
  staging.dbname = "app";
  staging.dumpPath = "/tmp/dumps/staging";

  configs.push_back(main);
  configs.push_back(staging);

  /* 1 Registry keeps configuration order */
  BOOST_REQUIRE_NO_THROW( registry = std::make_shared<ConnectionRegistry>(configs) );
  BOOST_CHECK( registry->size() == 2 );
  BOOST_CHECK( registry->names()[0] == "main" );
  BOOST_CHECK( registry->names()[1] == "staging" );

  /* 2 Lookup */
  BOOST_CHECK( registry->exists("staging") );
  BOOST_CHECK( registry->get("staging")->dumpPath == boost::filesystem::path("/tmp/dumps/staging") );
  BOOST_CHECK( !registry->exists("Main") );
  BOOST_CHECK_THROW( registry->get("Main"), CUnknownConnection );

  /* 3 Duplicate names are rejected */
  configs.push_back(main);
  BOOST_CHECK_THROW( ConnectionRegistry dup(configs), CConnectionConfigIssue );

  /* 4 Names must not escape the dump directory */
  std::vector<ConnectionConfig> bad;
  ConnectionConfig evil = main;
  evil.name = "../main";
  bad.push_back(evil);
  BOOST_CHECK_THROW( ConnectionRegistry invalid(bad), CConnectionConfigIssue );

  /* 5 Dumps of a dot-prefixed name would be hidden files */
  bad[0].name = ".staging";
  BOOST_CHECK_THROW( ConnectionRegistry hidden(bad), CConnectionConfigIssue );

  bad[0].name = "staging.old";
  BOOST_CHECK_NO_THROW( ConnectionRegistry dotted(bad) );

}
