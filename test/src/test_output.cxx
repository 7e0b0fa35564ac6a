#define BOOST_TEST_MODULE TestOutputFormatter
#include <boost/test/unit_test.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <output.hxx>
#include <fakes.hxx>

using namespace pgdumpctl;
namespace pt = boost::property_tree;

static std::vector<std::shared_ptr<const ConnectionConfig>> make_connections() {

  std::vector<std::shared_ptr<const ConnectionConfig>> result;
  ConnectionConfig conn = make_connection("main", "/var/lib/dumps/main");

  conn.wipeSchemas.push_back("public");
  conn.wipeSchemas.push_back("audit");

  result.push_back(std::make_shared<const ConnectionConfig>(conn));
  return result;

}

BOOST_AUTO_TEST_CASE(TestOutputFormatterFactory)
{

  std::shared_ptr<RuntimeConfiguration> rtc
    = RuntimeVariableEnvironment::createRuntimeConfiguration();
  std::shared_ptr<OutputFormatter> formatter = nullptr;

  /* 1 Requires a runtime configuration */
  BOOST_CHECK_THROW( OutputFormatter::formatter(nullptr, OUTPUT_CONSOLE), CPGDumpCtlFailure );

  /* 2 Type follows output.format */
  BOOST_REQUIRE_NO_THROW( formatter = OutputFormatter::formatter(rtc) );
  BOOST_CHECK( std::dynamic_pointer_cast<ConsoleOutputFormatter>(formatter) != nullptr );

  rtc->assign("output.format", "json");
  BOOST_REQUIRE_NO_THROW( formatter = OutputFormatter::formatter(rtc) );
  BOOST_CHECK( std::dynamic_pointer_cast<JsonOutputFormatter>(formatter) != nullptr );

}

BOOST_AUTO_TEST_CASE(TestOutputConnectionsHidePassword)
{

  std::shared_ptr<RuntimeConfiguration> rtc
    = RuntimeVariableEnvironment::createRuntimeConfiguration();
  std::ostringstream console;
  std::ostringstream json;
  pt::ptree tree;

  OutputFormatter::formatter(rtc, OUTPUT_CONSOLE)->nodeAs(make_connections(), console);
  OutputFormatter::formatter(rtc, OUTPUT_JSON)->nodeAs(make_connections(), json);

  BOOST_CHECK( console.str().find("main") != std::string::npos );
  BOOST_CHECK( console.str().find("s3cret") == std::string::npos );
  BOOST_CHECK( json.str().find("s3cret") == std::string::npos );

  std::istringstream in(json.str());
  BOOST_REQUIRE_NO_THROW( pt::read_json(in, tree) );

  BOOST_CHECK( tree.get<int>("num_connections") == 1 );

  pt::ptree &first = tree.get_child("connections").front().second;
  BOOST_CHECK( first.get<std::string>("name") == "main" );
  BOOST_CHECK( first.get<int>("port") == 5433 );
  BOOST_CHECK( first.get<bool>("prevent_restore") == false );
  BOOST_CHECK( first.get_child("wipe_schemas").size() == 2 );

}

BOOST_AUTO_TEST_CASE(TestOutputOperationResult)
{

  std::shared_ptr<RuntimeConfiguration> rtc
    = RuntimeVariableEnvironment::createRuntimeConfiguration();
  OperationResult result = OperationResult::failure(OPERR_PROCESS_FAILED,
                                                    "pg_dump exited with code 1");
  std::ostringstream console;
  std::ostringstream json;
  pt::ptree tree;

  result.action = ACTION_DUMP;
  result.connection = "main";
  result.exitCode = 1;
  result.stderrTail = "pg_dump: error: connection refused";

  OutputFormatter::formatter(rtc, OUTPUT_CONSOLE)->nodeAs(result, console);
  BOOST_CHECK( console.str().find("connection refused") != std::string::npos );

  OutputFormatter::formatter(rtc, OUTPUT_JSON)->nodeAs(result, json);

  std::istringstream in(json.str());
  BOOST_REQUIRE_NO_THROW( pt::read_json(in, tree) );

  BOOST_CHECK( tree.get<std::string>("result.action") == "dump" );
  BOOST_CHECK( tree.get<std::string>("result.status") == "failed" );
  BOOST_CHECK( tree.get<std::string>("result.error") == "process failed" );
  BOOST_CHECK( tree.get<int>("result.exit_code") == 1 );
  BOOST_CHECK( tree.get<std::string>("result.stderr") == "pg_dump: error: connection refused" );

}

BOOST_AUTO_TEST_CASE(TestOutputDumpList)
{

  std::shared_ptr<RuntimeConfiguration> rtc
    = RuntimeVariableEnvironment::createRuntimeConfiguration();
  std::vector<DumpArtifact> dumps;
  DumpArtifact artifact;
  std::ostringstream json;
  pt::ptree tree;

  artifact.id = "main_2024-01-01T00-00-00.dump";
  artifact.displayName = "main_2024-01-01T00-00-00";
  artifact.path = "/var/lib/dumps/main/main_2024-01-01T00-00-00.dump";
  artifact.createdAt = 1704067200;
  artifact.sizeBytes = 4096;
  dumps.push_back(artifact);

  OutputFormatter::formatter(rtc, OUTPUT_JSON)->nodeAs("main", dumps, json);

  std::istringstream in(json.str());
  BOOST_REQUIRE_NO_THROW( pt::read_json(in, tree) );

  BOOST_CHECK( tree.get<std::string>("connection") == "main" );
  BOOST_CHECK( tree.get<int>("num_dumps") == 1 );

  pt::ptree &first = tree.get_child("dumps").front().second;
  BOOST_CHECK( first.get<std::string>("id") == "main_2024-01-01T00-00-00.dump" );
  BOOST_CHECK( first.get<uintmax_t>("size") == 4096 );

}

BOOST_AUTO_TEST_CASE(TestOutputError)
{

  CUnknownConnection e("unknown connection \"foo\"");
  std::ostringstream console;
  std::ostringstream json;
  pt::ptree tree;

  OutputFormatter::nodeAs(e, console, "console");
  BOOST_CHECK( console.str().find("ERROR: unknown connection") == 0 );

  OutputFormatter::nodeAs(e, json, "json");

  std::istringstream in(json.str());
  BOOST_REQUIRE_NO_THROW( pt::read_json(in, tree) );
  BOOST_CHECK( tree.get<std::string>("severity") == "error" );
  BOOST_CHECK( tree.get<std::string>("message") == "unknown connection \"foo\"" );

}
