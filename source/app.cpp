#include <gitfile/app.hpp>
#include <gitfile/classifier.hpp>
#include <gitfile/cli.hpp>
#include <gitfile/error.hpp>
#include <gitfile/git.hpp>
#include <gitfile/history.hpp>
#include <gitfile/report.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <type_traits>
#include <variant>

#include <sys/wait.h>

#ifndef GITFILE_VERSION
#define GITFILE_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace gitfile {

static const char *kUsage =
    R"(Usage: gitfile [-v|--verbose]... [-q|--quiet]... [--] <file>
       gitfile -h | --help | --version
)";

static const char *kManual =
    R"(GITFILE(1)

NAME
  gitfile - summarize the git status of a single file

SYNOPSIS
  gitfile [-v|--verbose]... [-q|--quiet]... [--] <file>
  gitfile -h | --help | --version

DESCRIPTION
  Reports whether <file> is outside any repository, an internal repository
  file, ignored, untracked, new, or tracked with or without changes. For new
  and changed files the staged (index vs last commit) and unstaged (working
  file vs index) changes are summarized as:

    Size change: +N%  net line growth relative to the previous version
    Modified lines: N%  inserted lines relative to the new line count

  A file without a previous version is reported as "all new".

OPTIONS
  -v, --verbose  Raise the verbosity level by one. May be repeated.
  -q, --quiet    Lower the verbosity level by one. May be repeated.
  -h             Print a short usage message.
  --help         Show this manual.
  --version      Print the version.
  --             End of options.

  The level starts at 1 and never drops below 0.
    0   classification only
    1   plus staged and unstaged change summaries
    2+  plus creation date, last modification date and top contributor

ENVIRONMENT
  GITFILE_GIT        git executable to run (default: git)
  GITFILE_LOG_LEVEL  diagnostic log level: trace, debug, info, warn, err
  PAGER              pager for --help (default: less)

EXIT STATUS
  0  a classification was printed
  1  git failed or produced unexpected output
  2  invalid invocation or unusable path

LIMITATIONS
  Renamed files are reported as new. A file that is both tracked and matched
  by an ignore rule is classified from git's tracked state.
)";

Config Config::from_env() {
  Config c;
  if (const char *g = std::getenv("GITFILE_GIT"); g && *g)
    c.git_exe = g;
  if (const char *p = std::getenv("PAGER"); p && *p)
    c.pager = p;
  if (const char *l = std::getenv("GITFILE_LOG_LEVEL"); l && *l)
    c.log_level = l;
  return c;
}

spdlog::level::level_enum Config::level() const {
  if (!log_level)
    return spdlog::level::warn;
  auto lvl = spdlog::level::from_str(*log_level);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && *log_level != "off")
    return spdlog::level::warn;
  return lvl;
}

static void setup_logging(const Config &cfg) {
  auto logger = spdlog::get("gitfile");
  if (!logger)
    logger = spdlog::stderr_color_mt("gitfile");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(cfg.level());
  if (cfg.log_level && cfg.level() == spdlog::level::warn &&
      *cfg.log_level != "warn" && *cfg.log_level != "warning")
    spdlog::warn("unknown GITFILE_LOG_LEVEL '{}', using warn", *cfg.log_level);
}

static void show_manual(const Config &cfg, std::ostream &out) {
  // a pager that dies early must not take us down with SIGPIPE
  auto old_handler = std::signal(SIGPIPE, SIG_IGN);
  FILE *pipe = popen(cfg.pager.c_str(), "w");
  if (pipe) {
    std::string text(kManual);
    size_t n = fwrite(text.data(), 1, text.size(), pipe);
    int rc = pclose(pipe);
    std::signal(SIGPIPE, old_handler);
    if (n == text.size() && rc != -1 && WIFEXITED(rc) &&
        WEXITSTATUS(rc) != 127)
      return;
    spdlog::debug("[app] pager '{}' failed (rc={})", cfg.pager, rc);
  } else {
    std::signal(SIGPIPE, old_handler);
  }
  out << kManual;
}

static int report(const Config &cfg, const CmdReport &c, std::ostream &out) {
  fs::path file = validate_path(c.path);
  GitCli git(cfg.git_exe);

  auto status = classify(git, file, c.verbosity >= 1);
  std::optional<History> history;
  if (c.verbosity >= 2 && status.has_history)
    history = lookup_history(git, file);

  out << render_report(c.path, status, history, c.verbosity);
  return 0;
}

int App::run(int argc, char **argv) {
  const Config cfg = Config::from_env();
  setup_logging(cfg);

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    std::cerr << kUsage;
    return 2;
  }

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;
          if constexpr (std::is_same_v<T, CmdUsage>) {
            *out_ << kUsage;
            return 0;
          } else if constexpr (std::is_same_v<T, CmdManual>) {
            show_manual(cfg, *out_);
            return 0;
          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            *out_ << fmt::format("gitfile {}\n", GITFILE_VERSION);
            return 0;
          } else {
            return report(cfg, c, *out_);
          }
        },
        *pr.cmd);
  } catch (const UsageError &e) {
    spdlog::error("{}", e.what());
    std::cerr << kUsage;
    return 2;
  } catch (const GitError &e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("internal error: {}", e.what());
    return 1;
  }
}

} // namespace gitfile
