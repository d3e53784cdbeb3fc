#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitfile/summary.hpp>

using namespace gitfile;

TEST_CASE("round_percent rounds half away from zero") {
  REQUIRE(round_percent(50, 100) == 1);
  REQUIRE(round_percent(-50, 100) == -1);
  REQUIRE(round_percent(149, 100) == 1);
  REQUIRE(round_percent(-249, 100) == -2);
  REQUIRE(round_percent(0, 7) == 0);
  REQUIRE(round_percent(100, 8) == 13);
}

TEST_CASE("new file: every line is new") {
  auto s = summarize({17, 0, 17});
  REQUIRE(s.all_new);
  REQUIRE_FALSE(s.size_change_percent.has_value());
  REQUIRE(s.modified_lines_percent == 100ul);
  REQUIRE(s.total_lines == 17);
  REQUIRE(format_summary(s) == "Modified lines: 100% (17 lines total, all new)");
}

TEST_CASE("staged growth of a 600-line file") {
  auto s = summarize({22, 0, 622});
  REQUIRE_FALSE(s.all_new);
  REQUIRE(s.size_change_percent == 4l);
  REQUIRE(s.modified_lines_percent == 4ul);
  REQUIRE(format_summary(s) ==
          "Size change: +4% Modified lines: 4% (622 lines total)");
}

TEST_CASE("shrinking and emptied files") {
  auto s = summarize({2, 12, 40});
  REQUIRE(s.size_change_percent == -20l);
  REQUIRE(s.modified_lines_percent == 5ul);
  REQUIRE(format_summary(s) ==
          "Size change: -20% Modified lines: 5% (40 lines total)");

  auto empty = summarize({0, 10, 0});
  REQUIRE(empty.size_change_percent == -100l);
  REQUIRE_FALSE(empty.modified_lines_percent.has_value());
  REQUIRE_FALSE(empty.all_new);
  REQUIRE(format_summary(empty) == "Size change: -100% (0 lines total)");
}

TEST_CASE("rewritten lines without net growth") {
  auto s = summarize({5, 5, 10});
  REQUIRE(s.size_change_percent == 0l);
  REQUIRE(format_summary(s) ==
          "Size change: +0% Modified lines: 50% (10 lines total)");
}

TEST_CASE("allNew exactly when there is no previous content") {
  REQUIRE(summarize({0, 0, 0}).all_new);
  REQUIRE(summarize({3, 0, 3}).all_new);
  REQUIRE_FALSE(summarize({3, 0, 4}).all_new);
  REQUIRE_FALSE(summarize({0, 1, 0}).all_new);
}

TEST_CASE("binary changes have no percentages") {
  ChangeStats st;
  st.binary = true;
  auto s = summarize(st);
  REQUIRE(s.binary);
  REQUIRE_FALSE(s.size_change_percent.has_value());
  REQUIRE_FALSE(s.modified_lines_percent.has_value());
  REQUIRE(format_summary(s) == "binary file changed");
}
