#include <gitfile/report.hpp>

#include <fmt/format.h>

namespace gitfile {

static std::string change_flags(const FileStatus &st) {
  if (st.is_staged && st.is_modified)
    return " (staged, modified)";
  if (st.is_staged)
    return " (staged)";
  if (st.is_modified)
    return " (modified)";
  return "";
}

static void append_line(std::string &out, const char *label,
                        const std::string &value) {
  out += fmt::format("  {:<17}{}\n", label, value);
}

std::string render_report(const std::string &display_path,
                          const FileStatus &status,
                          const std::optional<History> &history,
                          int verbosity) {
  std::string out = fmt::format("{}: {}", display_path,
                                to_string(status.classification));
  if (status.classification == FileClassification::NewWithChanges ||
      status.classification == FileClassification::TrackedWithChanges)
    out += change_flags(status);
  out += '\n';

  if (verbosity < 1)
    return out;

  if (status.staged)
    append_line(out, "Staged:", format_summary(*status.staged));
  if (status.unstaged)
    append_line(out, "Unstaged:", format_summary(*status.unstaged));

  if (verbosity < 2 || !history || !status.has_history)
    return out;

  std::string created = history->created.value_or("unknown");
  if (history->created_ambiguous)
    created += " (warning: rename history is ambiguous, date ignores renames)";
  append_line(out, "Created:", created);
  append_line(out, "Last modified:", history->last_modified.value_or("never"));
  if (history->top_contributor) {
    const auto &c = *history->top_contributor;
    append_line(out, "Top contributor:",
                fmt::format("{} ({} of {} commits)", c.name, c.commits,
                            c.total));
  }
  return out;
}

} // namespace gitfile
