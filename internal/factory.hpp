#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace checkout::db {
class Repository;
}
namespace checkout::scheduler {
class DelayedJobWorker;
}
namespace checkout::notify {
class Notifier;
}

namespace checkout::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives
  for the lifetime of the process; the worker is already started.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<scheduler::DelayedJobWorker>  worker;
  std::shared_ptr<notify::Notifier>             notifier;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows concrete database, lock and
  cache backends.
*/
Application Build(const checkout::runtime::config::RuntimeConfig& config);

} // namespace checkout::factory
