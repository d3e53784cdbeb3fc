#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace gitfile {

struct ChangeStats {
  std::size_t inserted{0};
  std::size_t deleted{0};
  std::size_t total_lines_after{0};
  bool binary{false};
};

struct Summary {
  std::optional<long> size_change_percent;
  std::optional<unsigned long> modified_lines_percent;
  std::size_t total_lines{0};
  bool all_new{false};
  bool binary{false};
};

// num/den rounded half away from zero; den must be positive.
long round_percent(long long num, long long den);

Summary summarize(const ChangeStats &stats);

// "Size change: +4% Modified lines: 4% (622 lines total)"
std::string format_summary(const Summary &s);

} // namespace gitfile
