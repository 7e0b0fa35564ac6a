#define BOOST_TEST_MODULE TestOrchestrationEngine
#include <boost/test/unit_test.hpp>
#include <orchestration.hxx>
#include <fakes.hxx>

using namespace pgdumpctl;
namespace bfs = boost::filesystem;

/*
 * Engine with two connections "main" and "locked", the
 * latter with restores disabled.
 */
class EngineFixture {
public:
  TempDirectory tmp;
  std::shared_ptr<FakeProcessRunner> runner;
  std::shared_ptr<FakeSchemaWiper> wiper;
  std::shared_ptr<OrchestrationEngine> engine;

  EngineFixture() {

    std::vector<ConnectionConfig> configs;
    ConnectionConfig locked = make_connection("locked", tmp.path / "locked");

    locked.preventRestore = true;

    configs.push_back(make_connection("main", tmp.path / "main"));
    configs.push_back(locked);

    runner = std::make_shared<FakeProcessRunner>();
    wiper = std::make_shared<FakeSchemaWiper>();
    engine = std::make_shared<OrchestrationEngine>(std::make_shared<ConnectionRegistry>(configs),
                                                   std::make_shared<DumpCatalog>(),
                                                   runner,
                                                   wiper,
                                                   RuntimeVariableEnvironment::createRuntimeConfiguration());

  }
};

BOOST_FIXTURE_TEST_CASE(TestEngineConnections, EngineFixture)
{

  std::vector<std::shared_ptr<const ConnectionConfig>> connections = engine->connections();

  BOOST_REQUIRE( connections.size() == 2 );
  BOOST_CHECK( connections[0]->name == "main" );
  BOOST_CHECK( connections[1]->name == "locked" );

  /* Missing dump directory, nothing dumped yet */
  BOOST_CHECK( engine->listDumps("main").empty() );
  BOOST_CHECK_THROW( engine->listDumps("nonexistent"), CUnknownConnection );

}

BOOST_FIXTURE_TEST_CASE(TestEngineDumpAndRestore, EngineFixture)
{

  OperationResult result;
  std::vector<DumpArtifact> dumps;

  /* 1 Dump shows up in the listing */
  BOOST_REQUIRE_NO_THROW( result = engine->dump("main") );
  BOOST_REQUIRE( result.succeeded() );
  BOOST_CHECK( result.action == ACTION_DUMP );
  BOOST_CHECK( result.connection == "main" );

  dumps = engine->listDumps("main");
  BOOST_REQUIRE( dumps.size() == 1 );
  BOOST_CHECK( dumps[0].path.string() == result.artifact );

  /* 2 Restore the listed artifact */
  BOOST_REQUIRE_NO_THROW( result = engine->restore("main", dumps[0].id, false) );
  BOOST_CHECK( result.succeeded() );
  BOOST_CHECK( result.action == ACTION_RESTORE );
  BOOST_CHECK( runner->calls() == 2 );
  BOOST_CHECK( wiper->calls == 0 );

  /* 3 Clean restore wipes first */
  BOOST_REQUIRE_NO_THROW( result = engine->restore("main", dumps[0].id, true) );
  BOOST_CHECK( result.succeeded() );
  BOOST_CHECK( wiper->calls == 1 );

  BOOST_CHECK( !engine->isBusy("main") );

}

BOOST_FIXTURE_TEST_CASE(TestEngineRestoreExistingDump, EngineFixture)
{

  OperationResult result;

  bfs::create_directories(tmp.path / "main");
  touch_file(tmp.path / "main" / "main_2024-01-01T00-00-00.dump", 1704067200);

  BOOST_REQUIRE_NO_THROW( result = engine->restore("main", "main_2024-01-01T00-00-00.dump", true) );

  BOOST_CHECK( result.succeeded() );
  BOOST_CHECK( wiper->calls == 1 );
  BOOST_REQUIRE( runner->calls() == 1 );
  BOOST_CHECK( runner->getCommands()[0].args.back()
               == (tmp.path / "main" / "main_2024-01-01T00-00-00.dump").string() );

}

BOOST_FIXTURE_TEST_CASE(TestEngineFailures, EngineFixture)
{

  OperationResult result;

  /* 1 Unknown connection, nothing runs */
  result = engine->dump("nonexistent");
  BOOST_CHECK( result.status == OPERATION_FAILED );
  BOOST_CHECK( result.error == OPERR_UNKNOWN_CONNECTION );
  BOOST_CHECK( result.action == ACTION_DUMP );

  result = engine->restore("nonexistent", "x.dump", false);
  BOOST_CHECK( result.error == OPERR_UNKNOWN_CONNECTION );
  BOOST_CHECK( runner->calls() == 0 );

  /* 2 Restore disabled, dump works */
  result = engine->dump("locked");
  BOOST_REQUIRE( result.succeeded() );

  bfs::path artifact(result.artifact);

  result = engine->restore("locked", artifact.filename().string(), true);
  BOOST_CHECK( result.error == OPERR_RESTORE_DISABLED );
  BOOST_CHECK( wiper->calls == 0 );
  BOOST_CHECK( runner->calls() == 1 );

  /* 3 Unknown dump */
  result = engine->restore("main", "main_1999-01-01T00-00-00.dump", false);
  BOOST_CHECK( result.error == OPERR_DUMP_NOT_FOUND );

  /* 4 Wipe failure */
  result = engine->dump("main");
  BOOST_REQUIRE( result.succeeded() );

  artifact = bfs::path(result.artifact);
  wiper->mode = FakeSchemaWiper::WIPE_FAIL;

  result = engine->restore("main", artifact.filename().string(), true);
  BOOST_CHECK( result.error == OPERR_WIPE_FAILED );
  BOOST_CHECK( runner->calls() == 2 );

}

BOOST_FIXTURE_TEST_CASE(TestEngineOperationInProgress, EngineFixture)
{

  CancellationHandler cancel;
  OperationResult first;
  OperationResult second;

  runner->mode = FakeProcessRunner::FAKE_BLOCK_UNTIL_CANCELLED;

  std::thread worker([&first, &cancel, this]() {
      first = engine->dump("main", &cancel);
    });

  while (!runner->started)
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

  /* 1 Second request for the same connection is rejected */
  BOOST_CHECK( engine->isBusy("main") );

  second = engine->dump("main");
  BOOST_CHECK( second.status == OPERATION_FAILED );
  BOOST_CHECK( second.error == OPERR_OPERATION_IN_PROGRESS );

  second = engine->restore("main", "main_2024-01-01T00-00-00.dump", false);
  BOOST_CHECK( second.error == OPERR_OPERATION_IN_PROGRESS );

  /* 2 Other connections aren't affected */
  BOOST_CHECK( !engine->isBusy("locked") );

  cancel.cancel();
  worker.join();

  /* 3 The first one ends cancelled and releases the connection */
  BOOST_CHECK( first.status == OPERATION_CANCELLED );
  BOOST_CHECK( !engine->isBusy("main") );
  BOOST_CHECK( engine->listDumps("main").empty() );
  BOOST_CHECK( runner->calls() == 1 );

}

BOOST_FIXTURE_TEST_CASE(TestEngineIndependentConnections, EngineFixture)
{

  CancellationHandler cancel;
  OperationResult first;
  OperationResult other;
  std::vector<DumpArtifact> dumps;
  std::shared_ptr<OperationHistory> history
    = std::make_shared<OperationHistory>((tmp.path / "history.sqlite").string());

  /* Only commands for "main" block */
  runner->mode = FakeProcessRunner::FAKE_BLOCK_UNTIL_CANCELLED;
  runner->blockMatching = "/main/";

  std::thread worker([&first, &cancel, this]() {
      first = engine->dump("main", &cancel);
    });

  while (!runner->started)
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

  /* 1 Another connection completes while "main" is still running */
  other = engine->dump("locked");
  BOOST_CHECK( other.succeeded() );

  dumps = engine->listDumps("locked");
  BOOST_REQUIRE( dumps.size() == 1 );

  other = engine->restore("locked", dumps[0].id, false);
  BOOST_CHECK( other.error == OPERR_RESTORE_DISABLED );

  BOOST_CHECK( engine->isBusy("main") );
  BOOST_CHECK( !engine->isBusy("locked") );

  /* 2 A history attached meanwhile journals the running operation */
  history->open_rw();
  engine->attachHistory(history);

  cancel.cancel();
  worker.join();

  BOOST_CHECK( first.status == OPERATION_CANCELLED );
  BOOST_CHECK( runner->calls() == 2 );

  std::vector<HistoryEntry> entries = history->list("");
  BOOST_REQUIRE( entries.size() == 1 );
  BOOST_CHECK( entries[0].connection == "main" );
  BOOST_CHECK( entries[0].status == "cancelled" );

}

BOOST_FIXTURE_TEST_CASE(TestEngineHistory, EngineFixture)
{

  std::shared_ptr<OperationHistory> history
    = std::make_shared<OperationHistory>((tmp.path / "history.sqlite").string());
  std::vector<HistoryEntry> entries;

  history->open_rw();
  engine->attachHistory(history);

  engine->dump("main");
  engine->restore("main", "main_1999-01-01T00-00-00.dump", false);
  engine->dump("nonexistent");

  /* Every outcome is journaled, newest first */
  entries = history->list("");
  BOOST_REQUIRE( entries.size() == 3 );
  BOOST_CHECK( entries[0].connection == "nonexistent" );
  BOOST_CHECK( entries[0].error == "unknown connection" );
  BOOST_CHECK( entries[1].action == "restore" );
  BOOST_CHECK( entries[1].error == "dump not found" );
  BOOST_CHECK( entries[2].action == "dump" );
  BOOST_CHECK( entries[2].status == "succeeded" );

  /* A broken history doesn't change the outcome */
  history->close();
  BOOST_CHECK( engine->dump("main").succeeded() );

  engine->attachHistory(nullptr);
  BOOST_CHECK( engine->getHistory() == nullptr );

}
