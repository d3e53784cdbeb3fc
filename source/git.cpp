#include <gitfile/error.hpp>
#include <gitfile/git.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace gitfile {

static const char *kDateFormat = "--format=%ad (%ar)";

static std::string join_args(const std::vector<std::string> &args) {
  std::ostringstream oss;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i)
      oss << ' ';
    oss << args[i];
  }
  return oss.str();
}

static std::size_t parse_count(const std::string &field,
                               const std::string &line) {
  try {
    size_t pos = 0;
    auto v = std::stoull(field, &pos);
    if (pos != field.size())
      throw std::invalid_argument(field);
    return static_cast<std::size_t>(v);
  } catch (const std::logic_error &) {
    throw GitError(fmt::format("unexpected numstat line: '{}'", line));
  }
}

GitCli::GitCli(std::string git_exe) : git_(std::move(git_exe)) {}

CmdResult GitCli::run_git(const std::vector<std::string> &args,
                          const fs::path &cwd) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(git_);
  // file names are never globs
  argv.emplace_back("--literal-pathspecs");
  argv.insert(argv.end(), args.begin(), args.end());
  auto r = run_command(argv, cwd);
  spdlog::debug("[git] {} (cwd={}) rc={}", join_args(argv), cwd.string(),
                r.exit_code);
  if (r.exit_code == 127)
    throw GitError(fmt::format("cannot execute '{}'", git_));
  return r;
}

std::string GitCli::run_git_checked(const std::vector<std::string> &args,
                                    const fs::path &cwd) const {
  auto r = run_git(args, cwd);
  if (r.exit_code != 0)
    throw GitError(fmt::format("git {} failed (rc={}): {}", join_args(args),
                               r.exit_code, trim(r.err)));
  return std::move(r.out);
}

RepoLocation GitCli::location(const fs::path &dir) const {
  auto r = run_git({"rev-parse", "--is-inside-work-tree", "--is-inside-git-dir"},
                   dir);
  if (r.exit_code != 0) {
    if (r.err.find("not a git repository") != std::string::npos)
      return RepoLocation::Outside;
    throw GitError(fmt::format("git rev-parse failed (rc={}): {}", r.exit_code,
                               trim(r.err)));
  }
  auto lines = split_lines(r.out);
  if (lines.size() != 2)
    throw GitError(fmt::format("unexpected rev-parse output: '{}'", trim(r.out)));
  if (lines[0] == "true")
    return RepoLocation::WorkTree;
  return RepoLocation::Internal;
}

bool GitCli::is_ignored(const fs::path &file) const {
  auto r = run_git({"check-ignore", "-q", "--", file.filename().string()},
                   file.parent_path());
  if (r.exit_code == 0)
    return true;
  if (r.exit_code == 1)
    return false;
  throw GitError(fmt::format("git check-ignore failed (rc={}): {}",
                             r.exit_code, trim(r.err)));
}

bool GitCli::has_history(const fs::path &file) const {
  auto dir = file.parent_path();
  // unborn branch: nothing has history yet
  auto head = run_git({"rev-parse", "--verify", "-q", "HEAD"}, dir);
  if (head.exit_code != 0)
    return false;
  auto out = run_git_checked(
      {"log", "-1", "--format=%H", "--", file.filename().string()}, dir);
  return !trim(out).empty();
}

std::optional<std::string> GitCli::status_code(const fs::path &file) const {
  auto out = run_git_checked({"status", "--porcelain", "--untracked-files=all",
                              "--", file.filename().string()},
                             file.parent_path());
  auto lines = split_lines(out);
  if (lines.empty())
    return std::nullopt;
  if (lines.size() != 1)
    throw GitError(fmt::format("expected one status line for {}, got {}",
                               file.string(), lines.size()));
  if (lines[0].size() < 3)
    throw GitError(fmt::format("malformed status line: '{}'", lines[0]));
  return lines[0].substr(0, 2);
}

DiffCounts GitCli::diff_stats(const fs::path &file, DiffScope scope) const {
  std::vector<std::string> args{"diff", "--numstat"};
  if (scope == DiffScope::Staged)
    args.emplace_back("--cached");
  args.emplace_back("--");
  args.push_back(file.filename().string());

  auto lines = split_lines(run_git_checked(args, file.parent_path()));
  DiffCounts dc;
  if (lines.empty())
    return dc;
  if (lines.size() != 1)
    throw GitError(fmt::format("expected one numstat line for {}, got {}",
                               file.string(), lines.size()));

  const auto &line = lines[0];
  auto t1 = line.find('\t');
  auto t2 = t1 == std::string::npos ? t1 : line.find('\t', t1 + 1);
  if (t2 == std::string::npos)
    throw GitError(fmt::format("unexpected numstat line: '{}'", line));
  auto ins = line.substr(0, t1);
  auto del = line.substr(t1 + 1, t2 - t1 - 1);
  if (ins == "-" && del == "-") {
    dc.binary = true;
    return dc;
  }
  dc.inserted = parse_count(ins, line);
  dc.deleted = parse_count(del, line);
  return dc;
}

std::size_t GitCli::line_count(const fs::path &file, DiffScope scope) const {
  if (scope == DiffScope::Staged) {
    auto rel = repo_path(file);
    auto blob = run_git_checked({"cat-file", "blob", ":" + rel},
                                file.parent_path());
    return count_lines(blob);
  }
  std::ifstream in(file, std::ios::binary);
  if (!in)
    throw GitError(fmt::format("cannot read {}", file.string()));
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  return count_lines(data);
}

std::string GitCli::repo_path(const fs::path &file) const {
  auto out = run_git_checked(
      {"ls-files", "--full-name", "--", file.filename().string()},
      file.parent_path());
  auto lines = split_lines(out);
  if (lines.size() != 1)
    throw GitError(fmt::format("{} is not in the index", file.string()));
  return lines[0];
}

std::vector<std::string> GitCli::creation_dates(const fs::path &file,
                                                bool follow_renames) const {
  std::vector<std::string> args{"log", "--diff-filter=A", "--date=short",
                                kDateFormat};
  if (follow_renames)
    args.emplace_back("--follow");
  args.emplace_back("--");
  args.push_back(file.filename().string());
  return split_lines(run_git_checked(args, file.parent_path()));
}

std::optional<std::string>
GitCli::last_modified_date(const fs::path &file) const {
  // no --follow: arriving under this name by a rename counts as a change
  auto out = run_git_checked({"log", "-1", "--diff-filter=AM", "--date=short",
                              kDateFormat, "--", file.filename().string()},
                             file.parent_path());
  auto s = trim(out);
  if (s.empty())
    return std::nullopt;
  return s;
}

std::vector<std::string> GitCli::authors(const fs::path &file) const {
  return split_lines(run_git_checked({"log", "--follow", "--diff-filter=AM",
                                      "--format=%an", "--",
                                      file.filename().string()},
                                     file.parent_path()));
}

} // namespace gitfile
