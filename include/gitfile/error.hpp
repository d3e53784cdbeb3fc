#pragma once
#include <stdexcept>
#include <string>

namespace gitfile {

// git failed, or produced output that cannot be interpreted.
class GitError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Bad invocation: missing/invalid argument or an unusable path.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace gitfile
