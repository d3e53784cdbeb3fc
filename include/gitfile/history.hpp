#pragma once
#include <gitfile/git.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitfile {

struct Contributor {
  std::string name;
  std::size_t commits{0};
  std::size_t total{0};
};

struct History {
  std::optional<std::string> created;
  // set when following renames gave several candidates and the date was
  // looked up again without --follow
  bool created_ambiguous{false};
  std::optional<std::string> last_modified;
  std::optional<Contributor> top_contributor;
};

// Most frequent name; equal counts go to the alphabetically first name.
std::optional<Contributor> top_contributor(const std::vector<std::string> &names);

History lookup_history(const GitBackend &git, const std::filesystem::path &file);

} // namespace gitfile
