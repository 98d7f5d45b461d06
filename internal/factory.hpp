#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/dispatch/fanout_hub.hpp"
#include "internal/pipeline/pipeline_worker.hpp"

namespace rowcast::factory {

/*
  Application

  Owns all long-lived objects used by the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<dispatch::FanoutHub>      hub;
  std::shared_ptr<pipeline::PipelineWorker> worker;
};

/*
  Build

  Composition root: the ONLY place that knows concrete repository,
  source and admission backends.
*/
Application Build(const rowcast::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const rowcast::runtime::config::RuntimeConfig& config);

} // namespace rowcast::factory
