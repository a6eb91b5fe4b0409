#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/core/tuner_broker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/broker_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/broker_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "livetv/broker/v1.hpp"
#include "tests/support/broker_fixtures.hpp"

namespace {

namespace v1   = livetv::broker::v1;
namespace util = livetv::util;

using livetv::testing::FakeClock;
using livetv::testing::FakeResolver;
using livetv::testing::MakeCredential;
using livetv::testing::MakeOptions;

struct Servers {
  Servers() {
    auto repository         = std::make_shared<livetv::db::memory::MemoryRepository>();
    auto options            = MakeOptions(1, {MakeCredential(1, "acme", 1)});
    options.stale_threshold = std::chrono::minutes(30);
    auto broker = std::make_shared<livetv::core::TunerBroker>(options, std::make_shared<FakeResolver>(), repository, clock.Fn());

    livetv::service::ServiceContext ctx;
    ctx.broker     = broker;
    ctx.repository = repository;

    broker_server = std::make_unique<livetv::grpc::BrokerServer>(std::make_shared<livetv::service::BrokerService>(ctx));
    admin_server  = std::make_unique<livetv::grpc::AdminServer>(std::make_shared<livetv::service::AdminService>(ctx));
  }

  v1::AdmissionResponse Request(const std::string& user, const std::string& channel, ::grpc::StatusCode expected = ::grpc::StatusCode::OK) {
    v1::RequestChannelRequest req;
    req.set_user_id(user);
    req.set_channel_key(channel);
    v1::AdmissionResponse resp;
    ::grpc::ServerContext grpc_ctx;
    const auto            status = broker_server->RequestChannel(&grpc_ctx, &req, &resp);
    assert(status.error_code() == expected);
    return resp;
  }

  FakeClock                                   clock;
  std::unique_ptr<livetv::grpc::BrokerServer> broker_server;
  std::unique_ptr<livetv::grpc::AdminServer>  admin_server;
};

void TestExceptionMapping() {
  using ::grpc::StatusCode;

  assert(livetv::grpc::ToStatus(util::InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(livetv::grpc::ToStatus(util::InvalidChannel("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(livetv::grpc::ToStatus(util::NoCapacityConfigured("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(livetv::grpc::ToStatus(util::SessionNotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(livetv::grpc::ToStatus(util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(livetv::grpc::ToStatus(util::ResourceFailed("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(livetv::grpc::ToStatus(util::QueueTimeout("x")).error_code() == StatusCode::DEADLINE_EXCEEDED);
  assert(livetv::grpc::ToStatus(util::PermissionDenied("x")).error_code() == StatusCode::PERMISSION_DENIED);
  assert(livetv::grpc::ToStatus(util::InvalidState("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(livetv::grpc::ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);

  const auto status = livetv::grpc::ToStatus(util::SessionNotFound("session not found: abc"));
  assert(status.error_message() == "session not found: abc");
}

void TestServeRunsBodyAndTranslates() {
  int  calls = 0;
  auto ok    = livetv::grpc::Serve(nullptr, [&] { ++calls; });
  assert(ok.ok());
  assert(calls == 1);

  auto failed = livetv::grpc::Serve(nullptr, [] { throw util::QueueTimeout("ticket expired"); });
  assert(failed.error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(failed.error_message() == "ticket expired");

  ::grpc::ServerContext unbound;
  assert(livetv::grpc::Serve(&unbound, [&] { ++calls; }).ok());
  assert(calls == 2);
}

void TestRequestChannelStatuses() {
  Servers s;

  auto granted = s.Request("alice", "10.1");
  assert(granted.has_session());
  assert(granted.session().resource_id() == 1);

  auto queued = s.Request("bob", "5.1");
  assert(queued.has_queued());
  assert(queued.queued().position() == 1);

  s.Request("carol", "not a channel", ::grpc::StatusCode::INVALID_ARGUMENT);
  s.Request("", "10.1", ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::RequestChannelRequest req;
  req.set_user_id("dave");
  req.set_channel_key("77");
  req.set_resource_kind(v1::RESOURCE_KIND_CREDENTIAL);
  req.set_provider_id("nobody");
  v1::AdmissionResponse resp;
  ::grpc::ServerContext grpc_ctx;
  assert(s.broker_server->RequestChannel(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestSessionStatuses() {
  Servers s;
  auto    granted = s.Request("alice", "10.1");

  {
    v1::HeartbeatRequest    req;
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;
    req.set_session_id("missing");
    assert(s.broker_server->Heartbeat(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    v1::HeartbeatRequest    req;
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;
    assert(s.broker_server->Heartbeat(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    v1::ReleaseSessionRequest req;
    google::protobuf::Empty   resp;
    ::grpc::ServerContext     grpc_ctx;
    req.set_session_id(granted.session().session_id());
    req.set_user_id("mallory");
    assert(s.broker_server->ReleaseSession(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  }
  {
    v1::ValidateStreamAccessRequest  req;
    v1::ValidateStreamAccessResponse resp;
    ::grpc::ServerContext            grpc_ctx;
    req.set_session_id(granted.session().session_id());
    req.set_channel_key("5.1");
    assert(s.broker_server->ValidateStreamAccess(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  }

  // tuner failure turns the session into a retryable error
  {
    v1::TunerRequest        req;
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;
    req.set_tuner_id(1);
    assert(s.admin_server->MarkTunerFailed(&grpc_ctx, &req, &resp).ok());
  }
  {
    v1::HeartbeatRequest    req;
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;
    req.set_session_id(granted.session().session_id());
    assert(s.broker_server->Heartbeat(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  }
  {
    v1::GetSessionRequest  req;
    v1::GetSessionResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    req.set_session_id(granted.session().session_id());
    assert(s.broker_server->GetSession(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    // beacon with no ids is still a success, as is releasing twice
    v1::ReleaseSessionRequest req;
    google::protobuf::Empty   resp;
    ::grpc::ServerContext     grpc_ctx;
    assert(s.broker_server->ReleaseSession(&grpc_ctx, &req, &resp).ok());
    req.set_session_id(granted.session().session_id());
    ::grpc::ServerContext again;
    assert(s.broker_server->ReleaseSession(&again, &req, &resp).ok());
  }
}

void TestQueueStatuses() {
  Servers s;
  s.Request("alice", "10.1");
  auto queued = s.Request("bob", "5.1");

  {
    v1::PollQueueRequest  req;
    v1::AdmissionResponse resp;
    ::grpc::ServerContext grpc_ctx;
    req.set_ticket_id("missing");
    assert(s.broker_server->PollQueue(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  s.clock.Advance(std::chrono::minutes(1));
  {
    v1::PollQueueRequest  req;
    v1::AdmissionResponse resp;
    ::grpc::ServerContext grpc_ctx;
    req.set_ticket_id(queued.queued().ticket_id());
    assert(s.broker_server->PollQueue(&grpc_ctx, &req, &resp).ok());
    assert(resp.has_queued());
  }

  s.clock.Advance(std::chrono::minutes(5));
  {
    v1::SweepNowRequest   req;
    v1::SweepNowResponse  resp;
    ::grpc::ServerContext grpc_ctx;
    assert(s.admin_server->SweepNow(&grpc_ctx, &req, &resp).ok());
    assert(resp.expired_tickets() == 1);
  }
  {
    v1::PollQueueRequest  req;
    v1::AdmissionResponse resp;
    ::grpc::ServerContext grpc_ctx;
    req.set_ticket_id(queued.queued().ticket_id());
    assert(s.broker_server->PollQueue(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  }
}

void TestAdminStatuses() {
  Servers s;

  {
    v1::TunerRequest        req;
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;
    req.set_tuner_id(9);
    assert(s.admin_server->MarkTunerFailed(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    v1::GetCredentialCapacityRequest req;
    v1::CredentialCapacity           resp;
    ::grpc::ServerContext            grpc_ctx;
    req.set_credential_id(42);
    assert(s.admin_server->GetCredentialCapacity(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    v1::TunerRequest        req;
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;
    req.set_tuner_id(1);
    assert(s.admin_server->MarkTunerFailed(&grpc_ctx, &req, &resp).ok());

    v1::SetTunerMaintenanceRequest maintenance;
    maintenance.set_tuner_id(1);
    maintenance.set_enabled(true);
    ::grpc::ServerContext again;
    assert(s.admin_server->SetTunerMaintenance(&again, &maintenance, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }
  {
    v1::ReleaseUserSessionsRequest req;
    v1::ReleaseCountResponse       resp;
    ::grpc::ServerContext          grpc_ctx;
    assert(s.admin_server->ReleaseUserSessions(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
}

} // namespace

int main() {
  TestExceptionMapping();
  TestServeRunsBodyAndTranslates();
  TestRequestChannelStatuses();
  TestSessionStatuses();
  TestQueueStatuses();
  TestAdminStatuses();

  std::cout << "livetv_unit_grpc_status: pass\n";
  return 0;
}
