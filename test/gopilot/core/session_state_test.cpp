#include "gopilot/core/session_state.hpp"

#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "test/gopilot/common/fakes.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using gopilot::RepositoryBinding;
using gopilot::SessionState;
using lsp::LifecycleState;

TEST_CASE("Documents are stored by URI", "[session_state]") {
  SessionState session;
  REQUIRE(session.DocumentCount() == 0);
  REQUIRE_FALSE(session.GetDocument("file:///a.py").has_value());

  session.StoreDocument("file:///b.py", "b");
  session.StoreDocument("file:///a.py", "a1");
  session.StoreDocument("file:///a.py", "a2");
  REQUIRE(session.DocumentCount() == 2);
  REQUIRE(session.GetDocument("file:///a.py") == "a2");

  const auto documents = session.Documents();
  REQUIRE(documents.begin()->first == "file:///a.py");

  session.RemoveDocument("file:///a.py");
  session.RemoveDocument("file:///never-opened.py");
  REQUIRE(session.DocumentCount() == 1);
  REQUIRE_FALSE(session.GetDocument("file:///a.py").has_value());
}

TEST_CASE("Snapshots are independent of later edits", "[session_state]") {
  SessionState session;
  session.StoreDocument("file:///a.py", "old");
  const auto snapshot = session.Documents();
  session.StoreDocument("file:///a.py", "new");
  REQUIRE(snapshot.at("file:///a.py") == "old");
}

TEST_CASE("Lifecycle transitions and exit codes", "[session_state]") {
  SECTION("Exit after shutdown") {
    SessionState session;
    REQUIRE(session.State() == LifecycleState::kUninitialized);
    session.MarkInitializing();
    REQUIRE(session.State() == LifecycleState::kInitializing);
    session.MarkInitialized();
    REQUIRE(session.State() == LifecycleState::kInitialized);
    session.MarkShutdownRequested();
    REQUIRE(session.State() == LifecycleState::kShutdownRequested);
    REQUIRE(session.MarkExited() == 0);
    REQUIRE(session.State() == LifecycleState::kExited);
  }

  SECTION("Exit without shutdown") {
    SessionState session;
    session.MarkInitializing();
    session.MarkInitialized();
    REQUIRE(session.MarkExited() == 1);
  }
}

TEST_CASE("Repository binding is replaced as a whole", "[session_state]") {
  SessionState session;
  REQUIRE(session.Binding().repository == nullptr);

  auto repository = std::make_shared<gopilot::test::FakeRepository>();
  session.BindRepository(RepositoryBinding{.repository = repository, .agent = nullptr});
  REQUIRE(session.Binding().repository == repository);

  session.BindRepository({});
  REQUIRE(session.Binding().repository == nullptr);
}

TEST_CASE("Concurrent writers do not lose documents", "[session_state]") {
  SessionState session;
  std::vector<std::jthread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&session, t] {
      for (int i = 0; i < 100; ++i) {
        session.StoreDocument(fmt::format("file:///{}/{}.py", t, i), "x");
        [[maybe_unused]] auto snapshot = session.Documents();
      }
    });
  }
  writers.clear();
  REQUIRE(session.DocumentCount() == 400);
}
