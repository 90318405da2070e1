#pragma once

#include <memory>

namespace checkout::core {
class CheckoutOrchestrator;
class SettlementService;
} // namespace checkout::core
namespace checkout::notify {
class Notifier;
}
namespace checkout::db {
class Repository;
}

namespace checkout::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<checkout::core::CheckoutOrchestrator> orchestrator;
  std::shared_ptr<checkout::core::SettlementService>    settlement;
  std::shared_ptr<checkout::notify::Notifier>           notifier;
  std::shared_ptr<checkout::db::Repository>             repository;
};

} // namespace checkout::service
