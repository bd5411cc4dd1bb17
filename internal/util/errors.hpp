#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace torrentfs::util {

/*
  Central error types.

  Every store operation reports failures with one of these.
  Messages carry the operation and the path involved.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IoError : public std::runtime_error {
 public:
  explicit IoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Whitelist rewrite failed after the new set was computed.
  whitelist() is what would have been stored.
*/
class WhitelistWriteError : public IoError {
 public:
  WhitelistWriteError(const std::string& msg, std::vector<std::string> whitelist)
      : IoError(msg), whitelist_(std::move(whitelist)) {
  }

  const std::vector<std::string>& whitelist() const {
    return whitelist_;
  }

 private:
  std::vector<std::string> whitelist_;
};

} // namespace torrentfs::util
