#pragma once
#include <spdlog/common.h>

#include <iostream>
#include <optional>
#include <string>

namespace gitfile {

struct Config {
  std::string git_exe = "git";
  std::string pager = "less";
  std::optional<std::string> log_level;

  // GITFILE_GIT, GITFILE_LOG_LEVEL, PAGER
  static Config from_env();

  // warn unless log_level names a spdlog level
  spdlog::level::level_enum level() const;
};

class App {
public:
  App() = default;
  explicit App(std::ostream &out) : out_(&out) {}

  int run(int argc, char **argv);

private:
  std::ostream *out_ = &std::cout;
};

} // namespace gitfile
