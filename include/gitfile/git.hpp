#pragma once
#include <gitfile/util.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitfile {

enum class RepoLocation { WorkTree, Internal, Outside };

enum class DiffScope { Staged, Unstaged };

struct DiffCounts {
  std::size_t inserted{0};
  std::size_t deleted{0};
  bool binary{false};
};

// Typed queries against a repository. Paths are absolute paths of regular
// files; implementations decide how to address them.
class GitBackend {
public:
  virtual ~GitBackend() = default;

  virtual RepoLocation location(const std::filesystem::path &dir) const = 0;
  virtual bool is_ignored(const std::filesystem::path &file) const = 0;
  virtual bool has_history(const std::filesystem::path &file) const = 0;

  // Two-character porcelain code, nullopt when git reports nothing.
  virtual std::optional<std::string>
  status_code(const std::filesystem::path &file) const = 0;

  virtual DiffCounts diff_stats(const std::filesystem::path &file,
                                DiffScope scope) const = 0;
  virtual std::size_t line_count(const std::filesystem::path &file,
                                 DiffScope scope) const = 0;

  virtual std::string repo_path(const std::filesystem::path &file) const = 0;

  // One "date (relative date)" line per commit that added the file.
  virtual std::vector<std::string>
  creation_dates(const std::filesystem::path &file,
                 bool follow_renames) const = 0;
  virtual std::optional<std::string>
  last_modified_date(const std::filesystem::path &file) const = 0;
  // Author name of every add/modify commit, newest first.
  virtual std::vector<std::string>
  authors(const std::filesystem::path &file) const = 0;
};

class GitCli : public GitBackend {
public:
  explicit GitCli(std::string git_exe = "git");

  RepoLocation location(const std::filesystem::path &dir) const override;
  bool is_ignored(const std::filesystem::path &file) const override;
  bool has_history(const std::filesystem::path &file) const override;
  std::optional<std::string>
  status_code(const std::filesystem::path &file) const override;
  DiffCounts diff_stats(const std::filesystem::path &file,
                        DiffScope scope) const override;
  std::size_t line_count(const std::filesystem::path &file,
                         DiffScope scope) const override;
  std::string repo_path(const std::filesystem::path &file) const override;
  std::vector<std::string>
  creation_dates(const std::filesystem::path &file,
                 bool follow_renames) const override;
  std::optional<std::string>
  last_modified_date(const std::filesystem::path &file) const override;
  std::vector<std::string>
  authors(const std::filesystem::path &file) const override;

  const std::string &executable() const { return git_; }

private:
  CmdResult run_git(const std::vector<std::string> &args,
                    const std::filesystem::path &cwd) const;
  // Throws GitError on a non-zero exit.
  std::string run_git_checked(const std::vector<std::string> &args,
                              const std::filesystem::path &cwd) const;

  std::string git_;
};

} // namespace gitfile
