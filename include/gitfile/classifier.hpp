#pragma once
#include <gitfile/git.hpp>
#include <gitfile/summary.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace gitfile {

enum class FileClassification {
  OutsideRepo,
  InternalRepoFile,
  Ignored,
  Untracked,
  TrackedNoChanges,
  NewWithChanges,
  TrackedWithChanges,
};

const char *to_string(FileClassification c);

struct StatusFlags {
  bool staged{false};
  bool modified{false};
  bool untracked{false};
  // added with --intent-to-add: content not staged yet
  bool intent_to_add{false};
};

// Interprets a two-character porcelain code. Deletions and unmerged entries
// throw GitError. Renames and copies count as staged additions; " A"
// (intent to add) is an unstaged new file.
StatusFlags parse_status_code(const std::string &code);

struct FileStatus {
  FileClassification classification{FileClassification::OutsideRepo};
  bool is_staged{false};
  bool is_modified{false};
  bool has_history{false};
  std::optional<Summary> staged;
  std::optional<Summary> unstaged;
};

// Summaries are only filled for new/tracked files, and only when
// with_summaries is set.
FileStatus classify(const GitBackend &git, const std::filesystem::path &file,
                    bool with_summaries = true);

Summary summarize_scope(const GitBackend &git,
                        const std::filesystem::path &file, DiffScope scope);

} // namespace gitfile
