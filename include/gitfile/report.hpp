#pragma once
#include <gitfile/classifier.hpp>
#include <gitfile/history.hpp>

#include <optional>
#include <string>

namespace gitfile {

// Level 0: classification only. 1: staged/unstaged summaries. 2+: history.
std::string render_report(const std::string &display_path,
                          const FileStatus &status,
                          const std::optional<History> &history, int verbosity);

} // namespace gitfile
