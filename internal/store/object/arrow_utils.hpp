#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace stagesync::store::object {

/*
  Helper: unwrap Arrow Result<T> or throw.

  IO failures surface as util::StoreUnavailable so callers can retry them.
*/
[[noreturn]] inline void Raise(const arrow::Status& status) {
  if (status.IsIOError()) throw util::StoreUnavailable(status.ToString());
  throw std::runtime_error(status.ToString());
}

template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) Raise(result.status());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) Raise(status);
}

// Returns the filesystem and the root path inside it.
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const stagesync::runtime::config::ObjectStoreConfig& config);

} // namespace stagesync::store::object
