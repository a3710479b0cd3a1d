#pragma once

#include <memory>

namespace stagesync::core {
class CacheManager;
}
namespace stagesync::sync {
class SyncService;
}
namespace stagesync::recovery {
class RecoveryService;
}

namespace stagesync::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<stagesync::core::CacheManager>        manager;
  std::shared_ptr<stagesync::sync::SyncService>         sync;
  std::shared_ptr<stagesync::recovery::RecoveryService> recovery;
};

} // namespace stagesync::service
