#include <gitfile/classifier.hpp>
#include <gitfile/error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace gitfile {

const char *to_string(FileClassification c) {
  switch (c) {
  case FileClassification::OutsideRepo:
    return "not in a git repository";
  case FileClassification::InternalRepoFile:
    return "internal git repository file";
  case FileClassification::Ignored:
    return "ignored";
  case FileClassification::Untracked:
    return "untracked";
  case FileClassification::TrackedNoChanges:
    return "tracked, no changes";
  case FileClassification::NewWithChanges:
    return "new, not yet committed";
  case FileClassification::TrackedWithChanges:
    return "tracked, with changes";
  }
  return "unknown";
}

StatusFlags parse_status_code(const std::string &code) {
  if (code.size() != 2)
    throw GitError(fmt::format("malformed status code '{}'", code));

  StatusFlags f;
  if (code == "??") {
    f.untracked = true;
    return f;
  }

  const char x = code[0];
  const char y = code[1];
  if (x == 'U' || y == 'U' || code == "AA" || code == "DD")
    throw GitError(fmt::format("file has unresolved merge conflicts ({})", code));
  if (x == 'D' || y == 'D')
    throw GitError(fmt::format("file is deleted in git but exists on disk ({})",
                               code));

  switch (x) {
  case 'A':
  case 'M':
  case 'R': // renames show up as additions
  case 'C':
  case 'T':
    f.staged = true;
    break;
  case ' ':
    break;
  default:
    throw GitError(fmt::format("unexpected status code '{}'", code));
  }
  switch (y) {
  case 'A':
    if (x != ' ')
      throw GitError(fmt::format("unexpected status code '{}'", code));
    f.intent_to_add = true;
    f.modified = true;
    break;
  case 'M':
  case 'T':
    f.modified = true;
    break;
  case ' ':
    break;
  default:
    throw GitError(fmt::format("unexpected status code '{}'", code));
  }
  return f;
}

Summary summarize_scope(const GitBackend &git, const fs::path &file,
                        DiffScope scope) {
  auto dc = git.diff_stats(file, scope);
  ChangeStats st{dc.inserted, dc.deleted, 0, dc.binary};
  if (!dc.binary)
    st.total_lines_after = git.line_count(file, scope);
  spdlog::debug("[classify] {} {}: +{} -{} total={}", file.string(),
                scope == DiffScope::Staged ? "staged" : "unstaged", st.inserted,
                st.deleted, st.total_lines_after);
  return summarize(st);
}

FileStatus classify(const GitBackend &git, const fs::path &file,
                    bool with_summaries) {
  FileStatus res{};

  switch (git.location(file.parent_path())) {
  case RepoLocation::Outside:
    res.classification = FileClassification::OutsideRepo;
    return res;
  case RepoLocation::Internal:
    res.classification = FileClassification::InternalRepoFile;
    return res;
  case RepoLocation::WorkTree:
    break;
  }

  if (git.is_ignored(file)) {
    res.classification = FileClassification::Ignored;
    return res;
  }

  res.has_history = git.has_history(file);
  StatusFlags flags;
  if (auto code = git.status_code(file))
    flags = parse_status_code(*code);
  res.is_staged = flags.staged;
  res.is_modified = flags.modified;

  // "??" wins over history: the file was removed from the index
  if (flags.untracked || (!res.has_history && !res.is_staged &&
                          !flags.intent_to_add)) {
    res.classification = FileClassification::Untracked;
    res.is_staged = false;
    res.is_modified = false;
    return res;
  }
  if (!res.has_history)
    res.classification = FileClassification::NewWithChanges;
  else if (res.is_staged || res.is_modified)
    res.classification = FileClassification::TrackedWithChanges;
  else
    res.classification = FileClassification::TrackedNoChanges;

  if (with_summaries) {
    if (res.is_staged)
      res.staged = summarize_scope(git, file, DiffScope::Staged);
    if (res.is_modified)
      res.unstaged = summarize_scope(git, file, DiffScope::Unstaged);
  }
  return res;
}

} // namespace gitfile
