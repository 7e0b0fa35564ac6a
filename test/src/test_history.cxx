#define BOOST_TEST_MODULE TestOperationHistory
#include <boost/test/unit_test.hpp>
#include <history.hxx>
#include <fakes.hxx>

using namespace pgdumpctl;

static OperationResult make_result(std::string connection,
                                   OperationAction action,
                                   OperationStatus status) {

  OperationResult result;

  result.connection = connection;
  result.action = action;
  result.status = status;
  result.error = (status == OPERATION_SUCCEEDED) ? OPERR_NONE : OPERR_PROCESS_FAILED;
  result.exitCode = (status == OPERATION_SUCCEEDED) ? 0 : 1;
  result.durationMs = 1234;
  result.started = 1704067200;

  if (status == OPERATION_SUCCEEDED)
    result.artifact = "/var/lib/dumps/" + connection + "_2024-01-01T00-00-00.dump";
  else
    result.message = "pg_dump exited with code 1";

  return result;

}

BOOST_AUTO_TEST_CASE(TestOperationHistorySetup)
{

  TempDirectory tmp;
  std::shared_ptr<OperationHistory> history = nullptr;

  /* 1 Not opened yet */
  BOOST_REQUIRE_NO_THROW( history = std::make_shared<OperationHistory>((tmp.path / "history.sqlite").string()) );
  BOOST_CHECK( !history->available() );
  BOOST_CHECK_THROW( history->record(OperationResult()), CHistoryIssue );

  /* 2 Open creates the schema */
  BOOST_REQUIRE_NO_THROW( history->open_rw() );
  BOOST_CHECK( history->available() );
  BOOST_CHECK( history->list("").empty() );

  /* 3 Close */
  BOOST_REQUIRE_NO_THROW( history->close() );
  BOOST_CHECK( !history->available() );

  /* 4 Unusable location */
  OperationHistory broken((tmp.path / "no" / "such" / "dir" / "history.sqlite").string());
  BOOST_CHECK_THROW( broken.open_rw(), CHistoryIssue );

}

BOOST_AUTO_TEST_CASE(TestOperationHistoryRecord)
{

  TempDirectory tmp;
  std::string file = (tmp.path / "history.sqlite").string();
  std::vector<HistoryEntry> entries;
  int first_id;
  int second_id;

  {
    OperationHistory history(file);

    history.open_rw();

    /* 1 Ids are increasing */
    first_id = history.record(make_result("main", ACTION_DUMP, OPERATION_SUCCEEDED));
    second_id = history.record(make_result("main", ACTION_RESTORE, OPERATION_FAILED));
    history.record(make_result("staging", ACTION_DUMP, OPERATION_SUCCEEDED));

    BOOST_CHECK( second_id > first_id );
  }

  /* 2 Entries survive reopening */
  OperationHistory history(file);
  history.open_rw();

  BOOST_REQUIRE_NO_THROW( entries = history.list("") );
  BOOST_REQUIRE( entries.size() == 3 );

  /* 3 Newest first */
  BOOST_CHECK( entries[0].connection == "staging" );
  BOOST_CHECK( entries[1].id == second_id );
  BOOST_CHECK( entries[2].id == first_id );

  /* 4 Stored values */
  BOOST_CHECK( entries[1].action == "restore" );
  BOOST_CHECK( entries[1].status == "failed" );
  BOOST_CHECK( entries[1].error == "process failed" );
  BOOST_CHECK( entries[1].exitCode == 1 );
  BOOST_CHECK( entries[1].artifact == "" );
  BOOST_CHECK( entries[1].message == "pg_dump exited with code 1" );
  BOOST_CHECK( entries[2].durationMs == 1234 );
  BOOST_CHECK( entries[2].artifact == "/var/lib/dumps/main_2024-01-01T00-00-00.dump" );
  BOOST_CHECK( entries[2].started == CPGDumpCtlBase::time_to_str(1704067200) );

  /* 5 Filter by connection and limit */
  entries = history.list("main");
  BOOST_CHECK( entries.size() == 2 );

  entries = history.list("main", 1);
  BOOST_REQUIRE( entries.size() == 1 );
  BOOST_CHECK( entries[0].id == second_id );

  entries = history.list("nonexistent");
  BOOST_CHECK( entries.empty() );

}
