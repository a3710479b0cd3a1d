#pragma once

#include <memory>

#include "internal/store/document_store.hpp"

namespace stagesync::recovery {

// Connectivity check used by network recovery. Check() never throws.
class HealthProbe {
 public:
  virtual ~HealthProbe() = default;

  virtual bool Check() = 0;
};

class StoreHealthProbe final : public HealthProbe {
 public:
  explicit StoreHealthProbe(std::shared_ptr<store::DocumentStore> store) : store_(std::move(store)) {
  }

  bool Check() override {
    return store_ && store_->Ping();
  }

 private:
  std::shared_ptr<store::DocumentStore> store_;
};

} // namespace stagesync::recovery
