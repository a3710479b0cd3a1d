#pragma once

#include <stdexcept>
#include <string>

namespace stagesync::util {

/*
  Central error types.

  Store adapters translate backend failures into these; the gRPC adapter
  maps them to status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient: the backing store could not be reached or refused the call.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SyncInProgress : public std::runtime_error {
 public:
  explicit SyncInProgress(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectivityTimeout : public std::runtime_error {
 public:
  explicit ConnectivityTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace stagesync::util
