#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gitfile {

struct CmdResult {
  int exit_code{};
  std::string out;
  std::string err;
};

// Runs argv without a shell. exit_code is 128+signal for killed children and
// -1 when the child could not be started.
CmdResult run_command(const std::vector<std::string> &argv,
                      const std::filesystem::path &cwd);

std::string trim(std::string_view s);
std::vector<std::string> split_lines(std::string_view s);

// Lines as git counts them: an unterminated last line still counts.
std::size_t count_lines(std::string_view s);

} // namespace gitfile
