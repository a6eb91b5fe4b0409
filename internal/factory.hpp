#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/tuner_broker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/liveness/liveness_monitor.hpp"
#include "internal/resolver/stream_url_resolver.hpp"

namespace livetv::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>   repository;
  std::shared_ptr<core::TunerBroker> broker;

  std::vector<std::unique_ptr<::grpc::Service>>             grpc_services;
  std::vector<std::shared_ptr<liveness::LivenessMonitor>> background_workers;
};

// Throws util::InvalidArgument on duplicate or zero credential ids,
// zero-capacity credentials and a non-positive stale threshold.
void ValidateConfig(const livetv::runtime::config::RuntimeConfig& config);

core::BrokerOptions       BuildBrokerOptions(const livetv::runtime::config::RuntimeConfig& config);
resolver::ResolverOptions BuildResolverOptions(const livetv::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const livetv::runtime::config::RuntimeConfig& config);

} // namespace livetv::factory
