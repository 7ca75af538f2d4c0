#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace dispatch::factory {

/*
  Application

  Everything the process keeps alive: the transport adapters handed to the
  server and the background machinery behind them (outbox worker, dispatch
  workers, offer timers). Stop() halts the background parts in dependency
  order.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  service::ServiceContext                       context;

  void Stop();
};

// Connects the configured backend and brings its schema up to date.
std::shared_ptr<db::Repository> BuildRepository(const dispatch::runtime::config::RuntimeConfig& config);

// Wires the dispatch components around `repository`. Nothing is started.
service::ServiceContext BuildContext(const dispatch::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

/*
  Build

  Composition root. The ONLY place that knows concrete DB types.
  Starts the outbox and scheduler and re-arms rides left searching by a
  previous run.
*/
Application Build(const dispatch::runtime::config::RuntimeConfig& config);

} // namespace dispatch::factory
