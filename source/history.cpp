#include <gitfile/error.hpp>
#include <gitfile/history.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <map>

namespace fs = std::filesystem;

namespace gitfile {

std::optional<Contributor>
top_contributor(const std::vector<std::string> &names) {
  std::map<std::string, std::size_t> counts;
  std::size_t total = 0;
  for (auto &n : names) {
    if (n.empty())
      continue;
    ++counts[n];
    ++total;
  }
  if (counts.empty())
    return std::nullopt;

  auto best = counts.begin();
  for (auto it = counts.begin(); it != counts.end(); ++it)
    if (it->second > best->second)
      best = it;
  return Contributor{best->first, best->second, total};
}

History lookup_history(const GitBackend &git, const fs::path &file) {
  History h;

  auto dates = git.creation_dates(file, true);
  if (dates.size() > 1) {
    spdlog::debug("[history] {} add commits found following renames, "
                  "retrying without --follow",
                  dates.size());
    h.created_ambiguous = true;
    dates = git.creation_dates(file, false);
    if (dates.size() > 1)
      throw GitError(fmt::format(
          "cannot determine creation date of {}: {} add commits", file.string(),
          dates.size()));
  }
  if (!dates.empty())
    h.created = dates.front();

  h.last_modified = git.last_modified_date(file);
  h.top_contributor = top_contributor(git.authors(file));
  return h;
}

} // namespace gitfile
