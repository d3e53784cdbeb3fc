#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitfile/util.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

using namespace gitfile;

static std::filesystem::path make_tmpdir(const std::string &prefix) {
  auto base = std::filesystem::temp_directory_path() / (prefix + "XXXXXX");
  std::string s = base.string();
  std::vector<char> buf(s.begin(), s.end());
  buf.push_back('\0');
  char *p = mkdtemp(buf.data());
  REQUIRE(p != nullptr);
  return std::filesystem::path(p);
}

TEST_CASE("trim and split_lines") {
  REQUIRE(trim("  true\n") == "true");
  REQUIRE(trim("\n\t ") == "");
  using lines = std::vector<std::string>;
  REQUIRE(split_lines("").empty());
  REQUIRE((split_lines("a\nb\n") == lines{"a", "b"}));
  REQUIRE((split_lines("a\r\nb") == lines{"a", "b"}));
}

TEST_CASE("count_lines counts an unterminated last line") {
  REQUIRE(count_lines("") == 0);
  REQUIRE(count_lines("one") == 1);
  REQUIRE(count_lines("one\n") == 1);
  REQUIRE(count_lines("one\ntwo") == 2);
  REQUIRE(count_lines("\n\n") == 2);
}

TEST_CASE("run_command captures output, exit code and cwd") {
  auto dir = make_tmpdir("gitfile_util_");
  auto r = run_command({"sh", "-c", "pwd; echo oops >&2; exit 3"}, dir);
  REQUIRE(r.exit_code == 3);
  REQUIRE(std::filesystem::equivalent(trim(r.out), dir));
  REQUIRE(trim(r.err) == "oops");

  auto missing = run_command({"gitfile-no-such-binary"}, dir);
  REQUIRE(missing.exit_code == 127);

  REQUIRE(run_command({}, dir).exit_code == -1);
}

TEST_CASE("run_command drains a large stderr", "[util]") {
  auto dir = make_tmpdir("gitfile_util_big_");
  auto r = run_command(
      {"sh", "-c", "head -c 300000 /dev/zero | tr '\\0' e >&2; echo done"},
      dir);
  REQUIRE(r.exit_code == 0);
  REQUIRE(r.err.size() == 300000);
  REQUIRE(trim(r.out) == "done");
}
