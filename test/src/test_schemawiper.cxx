#define BOOST_TEST_MODULE TestSchemaWiper
#include <boost/test/unit_test.hpp>
#include <atomic>
#include <thread>
#include <schemawiper.hxx>

using namespace pgdumpctl;

BOOST_AUTO_TEST_CASE(TestSchemaWiperStatements)
{

  /* 1 Identifier quoting */
  BOOST_CHECK( PGSchemaWiper::quoteIdent("accounts") == "\"accounts\"" );
  BOOST_CHECK( PGSchemaWiper::quoteIdent("Mixed Case") == "\"Mixed Case\"" );
  BOOST_CHECK( PGSchemaWiper::quoteIdent("evil\"; DROP DATABASE x; --")
               == "\"evil\"\"; DROP DATABASE x; --\"" );

  /* 2 DROP statement */
  BOOST_CHECK( PGSchemaWiper::dropStatement("public", "accounts")
               == "DROP TABLE IF EXISTS \"public\".\"accounts\" CASCADE" );

  /* 3 Catalog query without schema list skips system schemas */
  std::string all = PGSchemaWiper::tableQuery(0);

  BOOST_CHECK( all.find("pg_catalog.pg_tables") != std::string::npos );
  BOOST_CHECK( all.find("NOT IN ('pg_catalog', 'information_schema')") != std::string::npos );
  BOOST_CHECK( all.find("pg\\_toast%") != std::string::npos );
  BOOST_CHECK( all.find("$1") == std::string::npos );

  /* 4 Explicit schema list is passed as parameters */
  std::string two = PGSchemaWiper::tableQuery(2);

  BOOST_CHECK( two.find("schemaname IN ($1, $2)") != std::string::npos );
  BOOST_CHECK( two.find("NOT IN") == std::string::npos );

}

BOOST_AUTO_TEST_CASE(TestSchemaWiperConnectionFailure)
{

  std::shared_ptr<RuntimeConfiguration> rtc
    = RuntimeVariableEnvironment::createRuntimeConfiguration();
  std::shared_ptr<ConnectionConfig> conn = std::make_shared<ConnectionConfig>();

  conn->name = "unreachable";
  conn->host = "127.0.0.1";
  conn->port = 1;
  conn->dbname = "app";
  conn->password = "s3cret";
  conn->dumpPath = "/tmp";

  rtc->assign("wipe.connect_timeout", "2");

  PGSchemaWiper wiper(rtc);

  /* Nothing listens on port 1, the wipe must fail cleanly */
  try {
    wiper.wipeAllTables(conn, nullptr);
    BOOST_FAIL("wipe against unreachable server succeeded");
  } catch (CWipeFailed &e) {
    BOOST_CHECK( std::string(e.what()).find("s3cret") == std::string::npos );
  }

}

BOOST_AUTO_TEST_CASE(TestSchemaWiperConcurrentConnections)
{

  std::shared_ptr<RuntimeConfiguration> rtc
    = RuntimeVariableEnvironment::createRuntimeConfiguration();
  std::atomic<int> mismatches(0);
  std::atomic<int> failures(0);

  rtc->assign("wipe.connect_timeout", "2");

  /* One wiper serves every connection of an engine */
  PGSchemaWiper wiper(rtc);

  auto wipe_repeatedly = [&wiper, &mismatches, &failures](int port) {

    std::shared_ptr<ConnectionConfig> conn = std::make_shared<ConnectionConfig>();
    std::string expected = "port " + CPGDumpCtlBase::intToStr(port);

    conn->name = "unreachable" + CPGDumpCtlBase::intToStr(port);
    conn->host = "127.0.0.1";
    conn->port = port;
    conn->dbname = "app";
    conn->dumpPath = "/tmp";

    for (int i = 0; i < 25; i++) {

      try {
        wiper.wipeAllTables(conn, nullptr);
      } catch (CWipeFailed &e) {
        failures++;

        /* The error must come from this wipe's own connection */
        if (std::string(e.what()).find(expected) == std::string::npos)
          mismatches++;
      }

    }

  };

  std::thread first(wipe_repeatedly, 1);
  std::thread second(wipe_repeatedly, 2);

  first.join();
  second.join();

  BOOST_CHECK( failures == 50 );
  BOOST_CHECK( mismatches == 0 );

}
