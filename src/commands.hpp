#pragma once
#include <string>

namespace modelgate {

class Gateway;
struct InferenceResult;

// Admin command handlers used by the REPL (main.cpp). Each returns a string
// result for the caller to print.

std::string cmd_stats(const Gateway& gateway);
std::string cmd_models(const Gateway& gateway);
std::string cmd_help();

// Calls every provider; may take up to the health timeout per provider.
std::string cmd_health(Gateway& gateway);

// These mutate gateway state.
std::string cmd_clear_cache(Gateway& gateway);
std::string cmd_reload(Gateway& gateway);
std::string cmd_reset(const std::string& args, Gateway& gateway);

// Dispatch one "/command args" line. Sets `quit` on /quit or /exit.
std::string run_command(const std::string& line, Gateway& gateway, bool& quit);

// One-line summary plus the output text
std::string format_result(const InferenceResult& result);

} // namespace modelgate
