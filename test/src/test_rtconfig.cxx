#define BOOST_TEST_MODULE TestRuntimeConfiguration
#include <boost/test/unit_test.hpp>
#include <algorithm>
#include <common.hxx>
#include <rtconfig.hxx>

using namespace pgdumpctl;

BOOST_AUTO_TEST_CASE(TestRuntimeConfigurationDefaults)
{

  std::shared_ptr<RuntimeConfiguration> rtc = nullptr;

  /* 1 Factory registers all variables */
  BOOST_REQUIRE_NO_THROW( rtc = RuntimeVariableEnvironment::createRuntimeConfiguration() );

  BOOST_CHECK( rtc->count_variables() == 12 );

  /* 2 Defaults */
  BOOST_CHECK( rtc->getString("output.format") == "console" );
  BOOST_CHECK( rtc->getString("pg_dump.binary") == "pg_dump" );
  BOOST_CHECK( rtc->getString("pg_restore.binary") == "pg_restore" );
  BOOST_CHECK( rtc->getBool("restore.no_owner") );
  BOOST_CHECK( rtc->getBool("restore.no_privileges") );
  BOOST_CHECK( !rtc->getBool("interactive.on_error_exit") );
  BOOST_CHECK( rtc->getInt("process.timeout") == 0 );
  BOOST_CHECK( rtc->getInt("process.kill_grace") == 5 );
  BOOST_CHECK( rtc->getInt("process.stderr_tail_kb") == 8 );
  BOOST_CHECK( rtc->getString("history.catalog") == "" );

  /* 3 names() is sorted */
  std::vector<std::string> names = rtc->names();
  BOOST_REQUIRE( names.size() == rtc->count_variables() );
  BOOST_CHECK( std::is_sorted(names.begin(), names.end()) );

  /* 4 Unknown variable */
  BOOST_CHECK_THROW( rtc->get("no.such.variable"), CPGDumpCtlFailure );

}

BOOST_AUTO_TEST_CASE(TestRuntimeConfigurationAssign)
{

  std::shared_ptr<RuntimeConfiguration> rtc
    = RuntimeVariableEnvironment::createRuntimeConfiguration();

  /* 1 Enum accepts listed values only */
  BOOST_REQUIRE_NO_THROW( rtc->assign("output.format", "json") );
  BOOST_CHECK( rtc->getString("output.format") == "json" );
  BOOST_CHECK_THROW( rtc->assign("output.format", "xml"), CPGDumpCtlFailure );
  BOOST_CHECK( rtc->getString("output.format") == "json" );

  /* 2 Integers are range checked */
  BOOST_REQUIRE_NO_THROW( rtc->assign("process.timeout", "3600") );
  BOOST_CHECK( rtc->getInt("process.timeout") == 3600 );
  BOOST_CHECK_THROW( rtc->assign("process.timeout", "-1"), CPGDumpCtlFailure );
  BOOST_CHECK_THROW( rtc->assign("process.timeout", "ten"), CPGDumpCtlFailure );
  BOOST_CHECK_THROW( rtc->assign("process.stderr_tail_kb", "0"), CPGDumpCtlFailure );

  /* 3 Booleans */
  BOOST_REQUIRE_NO_THROW( rtc->assign("restore.no_owner", "off") );
  BOOST_CHECK( !rtc->getBool("restore.no_owner") );
  BOOST_REQUIRE_NO_THROW( rtc->assign("restore.no_owner", "YES") );
  BOOST_CHECK( rtc->getBool("restore.no_owner") );
  BOOST_CHECK_THROW( rtc->assign("restore.no_owner", "maybe"), CPGDumpCtlFailure );

  /* 4 name=value form */
  BOOST_REQUIRE_NO_THROW( rtc->assign("pg_dump.binary=/usr/lib/postgresql/16/bin/pg_dump") );
  BOOST_CHECK( rtc->getString("pg_dump.binary") == "/usr/lib/postgresql/16/bin/pg_dump" );
  BOOST_CHECK_THROW( rtc->assign("pg_dump.binary"), CPGDumpCtlFailure );
  BOOST_CHECK_THROW( rtc->assign("=value"), CPGDumpCtlFailure );

  /* 5 Typed getter on a variable of another type */
  BOOST_CHECK_THROW( rtc->getInt("output.format"), CPGDumpCtlFailure );

  /* 6 Reset restores the default */
  rtc->reset("process.timeout");
  BOOST_CHECK( rtc->getInt("process.timeout") == 0 );

}

static std::string hook_value = "";

static void remember_value(std::string value) {
  hook_value = value;
}

BOOST_AUTO_TEST_CASE(TestRuntimeConfigurationAssignHook)
{

  std::shared_ptr<RuntimeConfiguration> rtc
    = RuntimeVariableEnvironment::createRuntimeConfiguration();
  std::shared_ptr<ConfigVariable> var = rtc->get("logging.level");

  var->set_assign_hook(remember_value);

  /* 1 reassign() calls the hook with the current value */
  var->reassign();
  BOOST_CHECK( hook_value == rtc->getString("logging.level") );

  /* 2 Assignment triggers the hook */
  rtc->assign("logging.level", "warning");
  BOOST_CHECK( hook_value == "warning" );

  /* 3 Rejected values don't */
  BOOST_CHECK_THROW( rtc->assign("logging.level", "verbose"), CPGDumpCtlFailure );
  BOOST_CHECK( hook_value == "warning" );

}

BOOST_AUTO_TEST_CASE(TestCommonConversions)
{

  BOOST_CHECK( CPGDumpCtlBase::strToInt("42") == 42 );
  BOOST_CHECK_THROW( CPGDumpCtlBase::strToInt("42abc"), CPGDumpCtlFailure );
  BOOST_CHECK_THROW( CPGDumpCtlBase::strToInt(""), CPGDumpCtlFailure );

  BOOST_CHECK( CPGDumpCtlBase::strToBool("true") );
  BOOST_CHECK( CPGDumpCtlBase::strToBool(" On ") );
  BOOST_CHECK( !CPGDumpCtlBase::strToBool("0") );
  BOOST_CHECK_THROW( CPGDumpCtlBase::strToBool("2"), CPGDumpCtlFailure );

  BOOST_CHECK( CPGDumpCtlBase::filename_timestamp(
                 boost::posix_time::time_from_string("2024-01-01 00:00:00"))
               == "2024-01-01T00-00-00" );

  /* resolving executables */
  BOOST_CHECK( !CPGDumpCtlBase::resolve_file_path("sh").empty() );
  BOOST_CHECK( CPGDumpCtlBase::resolve_file_path("/no/such/pg_dump").empty() );
  BOOST_CHECK( CPGDumpCtlBase::resolve_file_path("pg_dumpctl_no_such_binary").empty() );

}
