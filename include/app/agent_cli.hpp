#pragma once

#include <istream>
#include <ostream>
#include <string_view>

#include "gopilot/agent/agent.hpp"

namespace app {

constexpr std::string_view kAgentPrompt = "gopilot> ";
constexpr std::string_view kNoResponse = "(no response)";

// Interactive agent session over `in`/`out`. Commands:
//   /review, /commit, /diff <base> [target], /summary [branch], /status,
//   /quit (or /exit, /q); anything else is a free-form question.
// Returns the process exit code: 1 when `agent` is null (not a repository).
auto RunAgentCli(gopilot::agent::Agent* agent, std::istream& in, std::ostream& out)
    -> int;

}  // namespace app
