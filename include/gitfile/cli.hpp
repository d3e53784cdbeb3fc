#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace gitfile {

struct CmdReport {
  std::string path;
  int verbosity = 1;
};

struct CmdUsage {};
struct CmdManual {};
struct CmdVersion {};

using Command = std::variant<CmdReport, CmdUsage, CmdManual, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

// Returns the absolute path of an existing regular file, or throws
// UsageError.
std::filesystem::path validate_path(const std::string &arg);

} // namespace gitfile
