#include <gitfile/util.hpp>

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitfile {

static int safe_pipe(int fds[2]) { return pipe2(fds, O_CLOEXEC); }

CmdResult run_command(const std::vector<std::string> &args,
                      const std::filesystem::path &cwd) {
  CmdResult res{};
  if (args.empty()) {
    res.exit_code = -1;
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.exit_code = -1;
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    return res;
  }
  if (safe_pipe(err_pipe) != 0) {
    res.exit_code = -1;
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    return res;
  }

  pid_t pid = fork();
  if (pid == -1) {
    res.exit_code = -1;
    res.err = "fork failed";
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      _exit(126);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    std::vector<char *> argv_c;
    argv_c.reserve(args.size() + 1);
    for (auto &s : args)
      argv_c.push_back(const_cast<char *>(s.c_str()));
    argv_c.push_back(nullptr);

    execvp(argv_c[0], argv_c.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);

  std::array<pollfd, 2> fds{};
  fds[0] = {out_pipe[0], POLLIN, 0};
  fds[1] = {err_pipe[0], POLLIN, 0};
  std::string *sinks[2] = {&res.out, &res.err};
  std::array<char, 4096> buf{};
  int open_fds = 2;
  while (open_fds > 0) {
    if (::poll(fds.data(), fds.size(), -1) < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(n));
      } else if (n < 0 && errno == EINTR) {
        continue;
      } else {
        close(fds[i].fd);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
  for (auto &p : fds)
    if (p.fd >= 0)
      close(p.fd);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      res.exit_code = -1;
      return res;
    }
  }
  if (WIFEXITED(status))
    res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.exit_code = 128 + WTERMSIG(status);
  else
    res.exit_code = -1;

  return res;
}

std::string trim(std::string_view s) {
  const char *ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos)
    return {};
  auto e = s.find_last_not_of(ws);
  return std::string(s.substr(b, e - b + 1));
}

std::vector<std::string> split_lines(std::string_view s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start < s.size()) {
    auto nl = s.find('\n', start);
    if (nl == std::string_view::npos) {
      out.emplace_back(s.substr(start));
      break;
    }
    auto line = s.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    out.emplace_back(line);
    start = nl + 1;
  }
  return out;
}

std::size_t count_lines(std::string_view s) {
  std::size_t n = 0;
  for (char c : s)
    if (c == '\n')
      ++n;
  if (!s.empty() && s.back() != '\n')
    ++n;
  return n;
}

} // namespace gitfile
