#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitfile/app.hpp>
#include <gitfile/util.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace gitfile;
namespace fs = std::filesystem;

static fs::path make_tmpdir(const std::string &prefix) {
  auto base = fs::temp_directory_path() / (prefix + "XXXXXX");
  std::string s = base.string();
  std::vector<char> buf(s.begin(), s.end());
  buf.push_back('\0');
  char *p = mkdtemp(buf.data());
  REQUIRE(p != nullptr);
  return fs::path(p);
}

static void git(const fs::path &dir, const std::vector<std::string> &args) {
  std::vector<std::string> argv{"git", "-c", "user.name=Test User", "-c",
                                "user.email=test@example.com", "-c",
                                "commit.gpgsign=false"};
  argv.insert(argv.end(), args.begin(), args.end());
  auto r = run_command(argv, dir);
  INFO(r.err);
  REQUIRE(r.exit_code == 0);
}

static fs::path make_repo(const std::string &prefix) {
  auto dir = make_tmpdir(prefix);
  git(dir, {"init", "-q"});
  return dir;
}

static void write_lines(const fs::path &file, int n, bool append = false) {
  std::ofstream o(file, append ? std::ios::app : std::ios::trunc);
  for (int i = 0; i < n; ++i)
    o << "line " << i << "\n";
}

static int run_app(std::vector<std::string> args, std::string *out = nullptr) {
  args.insert(args.begin(), "gitfile");
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  std::ostringstream oss;
  int rc = App{oss}.run(static_cast<int>(args.size()), argv.data());
  if (out)
    *out = oss.str();
  return rc;
}

static bool contains(const std::string &hay, const std::string &needle) {
  return hay.find(needle) != std::string::npos;
}

TEST_CASE("usage errors exit with 2", "[app]") {
  auto dir = make_tmpdir("gitfile_app_usage_");
  std::string out;
  REQUIRE(run_app({}, &out) == 2);
  REQUIRE(out.empty());
  REQUIRE(run_app({(dir / "missing.txt").string()}, &out) == 2);
  REQUIRE(out.empty());
  REQUIRE(run_app({dir.string()}, &out) == 2);
  REQUIRE(out.empty());
  REQUIRE(run_app({"--bogus", "x"}) == 2);
}

TEST_CASE("usage, manual and version", "[app]") {
  std::string out;
  REQUIRE(run_app({"-h"}, &out) == 0);
  REQUIRE(contains(out, "Usage: gitfile"));

  REQUIRE(run_app({"--version"}, &out) == 0);
  REQUIRE(out.rfind("gitfile ", 0) == 0);

  setenv("PAGER", "gitfile-no-such-pager", 1);
  REQUIRE(run_app({"--help"}, &out) == 0);
  unsetenv("PAGER");
  REQUIRE(contains(out, "EXIT STATUS"));
}

TEST_CASE("file outside any repository", "[app]") {
  auto dir = make_tmpdir("gitfile_app_outside_");
  auto file = dir / "plain.txt";
  write_lines(file, 1);
  std::string out;
  REQUIRE(run_app({file.string()}, &out) == 0);
  REQUIRE(out == file.string() + ": not in a git repository\n");
}

TEST_CASE("verbosity levels on a repository file", "[app]") {
  auto repo = make_repo("gitfile_app_levels_");
  auto file = repo / "a.txt";
  write_lines(file, 10);
  git(repo, {"add", "a.txt"});
  git(repo, {"commit", "-q", "-m", "add a"});
  write_lines(file, 10, true);
  git(repo, {"add", "a.txt"});

  std::string out;
  REQUIRE(run_app({"-q", file.string()}, &out) == 0);
  REQUIRE(out == file.string() + ": tracked, with changes (staged)\n");

  REQUIRE(run_app({file.string()}, &out) == 0);
  REQUIRE(contains(out, "Staged:          Size change: +100% Modified lines: "
                        "50% (20 lines total)"));
  REQUIRE_FALSE(contains(out, "Created:"));

  REQUIRE(run_app({"-v", "--", file.string()}, &out) == 0);
  REQUIRE(contains(out, "Created:"));
  REQUIRE(contains(out, "Last modified:"));
  REQUIRE(contains(out, "Top contributor: Test User (1 of 1 commits)"));
}

TEST_CASE("git failures exit with 1", "[app]") {
  auto dir = make_tmpdir("gitfile_app_nogit_");
  auto file = dir / "f.txt";
  write_lines(file, 1);
  setenv("GITFILE_GIT", "gitfile-no-such-git", 1);
  int rc = run_app({file.string()});
  unsetenv("GITFILE_GIT");
  REQUIRE(rc == 1);
}

TEST_CASE("log level from the environment", "[app]") {
  Config cfg;
  REQUIRE(cfg.level() == spdlog::level::warn);
  cfg.log_level = "debug";
  REQUIRE(cfg.level() == spdlog::level::debug);
  cfg.log_level = "off";
  REQUIRE(cfg.level() == spdlog::level::off);
  cfg.log_level = "loud";
  REQUIRE(cfg.level() == spdlog::level::warn);

  setenv("GITFILE_LOG_LEVEL", "loud", 1);
  REQUIRE(Config::from_env().level() == spdlog::level::warn);
  unsetenv("GITFILE_LOG_LEVEL");
}
