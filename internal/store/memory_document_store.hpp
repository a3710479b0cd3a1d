#pragma once

#include <atomic>
#include <map>
#include <shared_mutex>

#include "internal/store/document_store.hpp"

namespace stagesync::store {

/*
  In-process store. Used for single-process deployments and as the durable
  store in tests; SetAvailable(false) simulates an outage.
*/
class MemoryDocumentStore final : public DocumentStore {
 public:
  explicit MemoryDocumentStore(std::string name = "memory");

  std::optional<std::string> Get(const std::string& key) override;
  void                       Put(const std::string& key, const std::string& value) override;
  bool                       Delete(const std::string& key) override;
  std::vector<std::string>   List(const std::string& prefix) override;
  bool                       Ping() override;

  std::string Name() const override {
    return name_;
  }

  void SetAvailable(bool available) {
    available_ = available;
  }

  uint64_t WriteCount() const {
    return writes_;
  }

 private:
  void CheckAvailable() const;

  std::string                        name_;
  mutable std::shared_mutex          mutex_;
  std::map<std::string, std::string> documents_;
  std::atomic<bool>                  available_{true};
  std::atomic<uint64_t>              writes_{0};
};

} // namespace stagesync::store
