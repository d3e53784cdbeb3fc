#include <gitfile/summary.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <vector>

namespace gitfile {

long round_percent(long long num, long long den) {
  if (num >= 0)
    return static_cast<long>((2 * num + den) / (2 * den));
  return -static_cast<long>((-2 * num + den) / (2 * den));
}

Summary summarize(const ChangeStats &stats) {
  Summary s;
  s.total_lines = stats.total_lines_after;
  s.binary = stats.binary;
  if (stats.binary)
    return s;

  auto ins = static_cast<long long>(stats.inserted);
  auto del = static_cast<long long>(stats.deleted);
  auto total = static_cast<long long>(stats.total_lines_after);
  long long prior = total - ins + del;

  if (prior > 0)
    s.size_change_percent = round_percent((ins - del) * 100, prior);
  else
    s.all_new = true;
  if (total > 0)
    s.modified_lines_percent =
        static_cast<unsigned long>(round_percent(ins * 100, total));
  return s;
}

std::string format_summary(const Summary &s) {
  if (s.binary)
    return "binary file changed";

  std::vector<std::string> parts;
  if (s.size_change_percent)
    parts.push_back(fmt::format("Size change: {:+}%", *s.size_change_percent));
  if (s.modified_lines_percent)
    parts.push_back(
        fmt::format("Modified lines: {}%", *s.modified_lines_percent));
  parts.push_back(fmt::format("({} lines total{})", s.total_lines,
                              s.all_new ? ", all new" : ""));
  return fmt::format("{}", fmt::join(parts, " "));
}

} // namespace gitfile
