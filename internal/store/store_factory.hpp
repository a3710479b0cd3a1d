#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/store/document_store.hpp"

namespace stagesync::store {

/*
  Builds a DocumentStore from its config block. An empty block yields an
  in-memory store; backends compiled out throw std::runtime_error.
*/
class StoreFactory {
 public:
  static std::shared_ptr<DocumentStore> Build(const stagesync::runtime::config::DocumentStoreConfig& cfg);
};

} // namespace stagesync::store
