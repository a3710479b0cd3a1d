#pragma once

#include <optional>
#include <string>
#include <vector>

namespace stagesync::store {

/*
  Key/value document store contract.

  Keys are slash separated paths ("events/<id>/artist-statuses/<id>.json"),
  values are JSON text. Implementations raise util::StoreUnavailable when the
  backend cannot be reached; upper layers never see backend error types.
*/
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;
  virtual void                       Put(const std::string& key, const std::string& value) = 0;
  virtual bool                       Delete(const std::string& key) = 0;

  // Keys starting with prefix, sorted.
  virtual std::vector<std::string> List(const std::string& prefix) = 0;

  // Cheap reachability check; never throws.
  virtual bool Ping() = 0;

  virtual std::string Name() const = 0;
};

} // namespace stagesync::store
