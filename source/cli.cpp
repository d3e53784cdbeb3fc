#include <gitfile/cli.hpp>
#include <gitfile/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace gitfile {

static bool has_drive(std::string_view s) {
  return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) &&
         s[1] == ':';
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  int verbose = 0;
  int quiet = 0;
  bool options_done = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (options_done || a.size() < 2 || a[0] != '-') {
      positional.emplace_back(a);
      continue;
    }
    if (a == "--") {
      options_done = true;
    } else if (a == "--help") {
      r.cmd = CmdManual{};
      return r;
    } else if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    } else if (a == "--verbose") {
      ++verbose;
    } else if (a == "--quiet") {
      ++quiet;
    } else if (a[1] == '-') {
      r.error = fmt::format("unknown option: {}", a);
      return r;
    } else {
      // bundled short flags: -vv, -vq, -h
      for (char c : a.substr(1)) {
        if (c == 'v') {
          ++verbose;
        } else if (c == 'q') {
          ++quiet;
        } else if (c == 'h') {
          r.cmd = CmdUsage{};
          return r;
        } else {
          r.error = fmt::format("unknown option: -{}", c);
          return r;
        }
      }
    }
  }

  if (positional.empty()) {
    r.error = "missing file argument";
    return r;
  }
  if (positional.size() > 1) {
    r.error = fmt::format("too many arguments: expected one file, got {}",
                          positional.size());
    return r;
  }

  r.cmd = CmdReport{positional.front(), std::max(0, 1 + verbose - quiet)};
  return r;
}

fs::path validate_path(const std::string &arg) {
  if (arg.empty())
    throw UsageError("empty file argument");
  fs::path p(arg);
  if (has_drive(arg) || p.has_root_name())
    throw UsageError(
        fmt::format("{}: paths with a volume or drive are not supported", arg));

  std::error_code ec;
  auto st = fs::status(p, ec);
  if (ec || !fs::exists(st))
    throw UsageError(fmt::format("{}: no such file", arg));
  if (!fs::is_regular_file(st))
    throw UsageError(fmt::format("{}: not a regular file", arg));

  auto abs = fs::absolute(p, ec);
  if (ec)
    throw UsageError(fmt::format("{}: {}", arg, ec.message()));
  return abs.lexically_normal();
}

} // namespace gitfile
