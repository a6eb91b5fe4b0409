#include "client/cpp/broker_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/tuner_broker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/broker_server.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/broker_service.hpp"
#include "tests/support/broker_fixtures.hpp"

namespace {

namespace v1 = livetv::broker::v1;

using livetv::broker::client::BrokerClient;
using livetv::testing::FakeResolver;
using livetv::testing::MakeCredential;
using livetv::testing::MakeOptions;

using namespace std::chrono_literals;

// One-tuner broker served over loopback.
struct LoopbackBroker {
  LoopbackBroker() {
    auto repository = std::make_shared<livetv::db::memory::MemoryRepository>();
    broker = std::make_shared<livetv::core::TunerBroker>(MakeOptions(1, {MakeCredential(3, "acme", 1)}), std::make_shared<FakeResolver>(), repository);

    livetv::service::ServiceContext ctx;
    ctx.broker     = broker;
    ctx.repository = repository;

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<livetv::grpc::BrokerServer>(std::make_shared<livetv::service::BrokerService>(ctx)));
    services.push_back(std::make_unique<livetv::grpc::AdminServer>(std::make_shared<livetv::service::AdminService>(ctx)));

    server = std::make_unique<livetv::runtime::Server>("127.0.0.1:0", std::move(services));
    server->Start();
    assert(server->SelectedPort() > 0);

    client = std::make_unique<BrokerClient>(
        ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->SelectedPort()), ::grpc::InsecureChannelCredentials()));
  }

  ~LoopbackBroker() {
    server->Stop();
  }

  std::shared_ptr<livetv::core::TunerBroker> broker;
  std::unique_ptr<livetv::runtime::Server>   server;
  std::unique_ptr<BrokerClient>              client;
};

v1::RequestChannelRequest Watch(const std::string& user, const std::string& channel) {
  v1::RequestChannelRequest req;
  req.set_user_id(user);
  req.set_channel_key(channel);
  return req;
}

void TestViewerLifecycle() {
  LoopbackBroker b;
  auto&          client = *b.client;

  auto granted = client.RequestChannel(Watch("alice", "10.1"));
  assert(granted.ok());
  assert(granted->has_session());
  const auto session_id = granted->session().session_id();

  assert(client.Heartbeat(session_id).ok());

  auto session = client.GetSession(session_id);
  assert(session.ok());
  assert(session->user_id() == "alice");

  auto listed = client.ListUserSessions("alice");
  assert(listed.ok() && listed->sessions_size() == 1);

  auto access = client.ValidateStreamAccess(session_id, "10.1");
  assert(access.ok());
  assert(access->stream_url() == "fake://tuner/1/10.1");

  assert(client.ReleaseSession(session_id, "alice").ok());
  assert(client.ReleaseSession(session_id, "alice").ok());

  auto gone = client.GetSession(session_id);
  assert(!gone.ok());
  assert(gone.status().IsKeyError());

  auto history = client.ListViewingHistory("alice");
  assert(history.ok() && history->entries_size() == 1);
}

void TestStatusMapping() {
  LoopbackBroker b;
  auto&          client = *b.client;

  auto invalid = client.RequestChannel(Watch("alice", "ten"));
  assert(!invalid.ok());
  assert(invalid.status().IsInvalid());

  auto no_pool = Watch("alice", "55");
  no_pool.set_resource_kind(v1::RESOURCE_KIND_CREDENTIAL);
  no_pool.set_provider_id("nobody");
  auto rejected = client.RequestChannel(no_pool);
  assert(!rejected.ok());
  assert(rejected.status().IsCapacityError());

  auto missing = client.Heartbeat("missing");
  assert(missing.IsKeyError());

  auto unknown_tuner = client.MarkTunerFailed(12);
  assert(unknown_tuner.IsKeyError());

  auto unreachable = BrokerClient(::grpc::CreateChannel("127.0.0.1:1", ::grpc::InsecureChannelCredentials())).Heartbeat("x");
  assert(!unreachable.ok());
  assert(unreachable.IsIOError());
}

void TestQueueAndWait() {
  LoopbackBroker b;
  auto&          client = *b.client;

  auto first  = client.RequestChannel(Watch("alice", "10.1"));
  auto second = client.RequestChannel(Watch("bob", "5.1"));
  assert(first.ok() && first->has_session());
  assert(second.ok() && second->has_queued());
  const auto ticket = second->queued().ticket_id();

  // still blocked: the wait gives up and cancels the ticket
  auto timed_out = client.WaitForSession(ticket, 10ms, 30ms);
  assert(!timed_out.ok());
  assert(timed_out.status().IsCancelled());
  assert(!client.PollQueue(ticket).ok());

  auto third = client.RequestChannel(Watch("carol", "5.1"));
  assert(third.ok() && third->has_queued());
  assert(client.ReleaseSession(first->session().session_id()).ok());

  auto promoted = client.WaitForSession(third->queued().ticket_id(), 10ms, 2s);
  assert(promoted.ok());
  assert(promoted->user_id() == "carol");
  assert(promoted->channel_key() == "5.1");
}

void TestAdminOperations() {
  LoopbackBroker b;
  auto&          client = *b.client;

  auto watching = client.RequestChannel(Watch("alice", "10.1"));
  assert(watching.ok() && watching->has_session());

  auto status = client.GetStatus();
  assert(status.ok());
  assert(status->tuners_size() == 1);
  assert(status->channel_mapping().at("10.1") == 1);

  assert(client.SetTunerMaintenance(1, true).ok());
  status = client.GetStatus();
  assert(status.ok() && status->tuners(0).status() == v1::TUNER_STATUS_MAINTENANCE);
  assert(status->active_sessions_size() == 0);
  assert(client.SetTunerMaintenance(1, false).ok());

  assert(client.MarkTunerFailed(1).ok());
  assert(client.MarkTunerRecovered(1).ok());

  auto stream = Watch("bob", "900");
  stream.set_resource_kind(v1::RESOURCE_KIND_CREDENTIAL);
  assert(client.RequestChannel(stream).ok());

  auto capacity = client.GetCredentialCapacity(3);
  assert(capacity.ok() && capacity->used() == 1 && capacity->available() == 0);

  auto released = client.ReleaseCredentialSessions(3);
  assert(released.ok() && *released == 1);

  assert(client.RequestChannel(Watch("bob", "10.1")).ok());
  auto by_user = client.ReleaseUserSessions("bob");
  assert(by_user.ok() && *by_user == 1);

  auto sweep = client.SweepNow();
  assert(sweep.ok());
  assert(sweep->expired_sessions() == 0);
}

} // namespace

int main() {
  TestViewerLifecycle();
  TestStatusMapping();
  TestQueueAndWait();
  TestAdminOperations();

  std::cout << "livetv_unit_broker_client: pass\n";
  return 0;
}
