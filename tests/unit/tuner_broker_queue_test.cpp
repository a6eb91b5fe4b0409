#include "internal/core/tuner_broker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "tests/support/broker_fixtures.hpp"

namespace {

using livetv::core::TunerBroker;
using livetv::model::EndReason;
using livetv::model::ResourceKind;
using livetv::model::UserClass;
using livetv::testing::CredentialRequest;
using livetv::testing::FakeClock;
using livetv::testing::FakeResolver;
using livetv::testing::MakeCredential;
using livetv::testing::MakeOptions;
using livetv::testing::ResourcesConsistent;
using livetv::testing::Throws;
using livetv::testing::TunerRequest;

namespace util = livetv::util;

std::shared_ptr<TunerBroker> MakeBroker(FakeClock& clock, livetv::core::BrokerOptions options,
                                        std::shared_ptr<livetv::db::Repository> repository = nullptr) {
  return std::make_shared<TunerBroker>(std::move(options), std::make_shared<FakeResolver>(), std::move(repository), clock.Fn());
}

void TestPriorityBeatsArrivalOrder() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(1));

  auto holder = broker->RequestChannel(TunerRequest("holder", "10.1"));

  auto standard_request       = TunerRequest("standard", "5.1");
  standard_request.user_class = UserClass::kStandard;
  auto standard               = broker->RequestChannel(standard_request);

  clock.Advance(std::chrono::seconds(1));
  auto premium_request       = TunerRequest("premium", "7.1");
  premium_request.user_class = UserClass::kPremium;
  auto premium               = broker->RequestChannel(premium_request);

  assert(premium.position == 1);
  assert(broker->PollQueue(standard.ticket_id).position == 2);

  broker->ReleaseSession(holder.session->id);
  assert(broker->PollQueue(premium.ticket_id).Granted());
  assert(!broker->PollQueue(standard.ticket_id).Granted());
  assert(broker->PollQueue(standard.ticket_id).position == 1);
}

void TestExplicitPriorityOverridesClass() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(1));
  broker->RequestChannel(TunerRequest("holder", "10.1"));

  auto admin_request       = TunerRequest("admin", "5.1");
  admin_request.user_class = UserClass::kAdmin;
  broker->RequestChannel(admin_request);

  auto urgent_request       = TunerRequest("urgent", "7.1");
  urgent_request.user_class = UserClass::kStandard;
  urgent_request.priority   = -1;
  auto urgent               = broker->RequestChannel(urgent_request);
  assert(urgent.position == 1);
}

void TestPromotionDrainsSameChannelWaiters() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(1));

  auto holder = broker->RequestChannel(TunerRequest("holder", "10.1"));
  auto first  = broker->RequestChannel(TunerRequest("first", "5.1"));
  auto other  = broker->RequestChannel(TunerRequest("other", "7.1"));
  auto second = broker->RequestChannel(TunerRequest("second", "5.1"));
  assert(second.position == 3);

  broker->ReleaseSession(holder.session->id);

  auto a = broker->PollQueue(first.ticket_id);
  auto b = broker->PollQueue(second.ticket_id);
  assert(a.Granted() && b.Granted());
  assert(a.session->resource_id == b.session->resource_id);

  const auto waiting = broker->PollQueue(other.ticket_id);
  assert(!waiting.Granted());
  assert(waiting.position == 1 && waiting.queue_length == 1);
  assert(ResourcesConsistent(broker->GetStatus()));
}

void TestQueuedRequestForBusyChannelSharesImmediately() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(1));

  broker->RequestChannel(TunerRequest("holder", "10.1"));
  auto waiting = broker->RequestChannel(TunerRequest("waiting", "5.1"));
  assert(!waiting.Granted());

  // sharing never waits behind the queue
  auto sharer = broker->RequestChannel(TunerRequest("sharer", "10.1"));
  assert(sharer.Granted());
}

void TestRetriedQueuedRequestKeepsTicket() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(1));
  broker->RequestChannel(TunerRequest("holder", "10.1"));

  auto first = broker->RequestChannel(TunerRequest("alice", "5.1"));
  clock.Advance(std::chrono::seconds(10));
  auto retry = broker->RequestChannel(TunerRequest("alice", "5.1"));

  assert(first.ticket_id == retry.ticket_id);
  assert(retry.position == 1 && retry.queue_length == 1);
}

void TestQueueTimeout() {
  FakeClock clock;
  auto      options       = MakeOptions(1);
  options.stale_threshold = std::chrono::minutes(30);
  auto broker             = MakeBroker(clock, options);

  broker->RequestChannel(TunerRequest("holder", "10.1"));
  auto waiting = broker->RequestChannel(TunerRequest("waiting", "5.1"));

  clock.Advance(std::chrono::minutes(5));
  assert(broker->Sweep().expired_tickets == 0);

  clock.Advance(std::chrono::milliseconds(1));
  const auto report = broker->Sweep();
  assert(report.expired_tickets == 1);
  assert(Throws<util::QueueTimeout>([&] { broker->PollQueue(waiting.ticket_id); }));
}

void TestCancelQueued() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(1));
  auto      holder = broker->RequestChannel(TunerRequest("holder", "10.1"));
  auto      a      = broker->RequestChannel(TunerRequest("a", "5.1"));
  auto      b      = broker->RequestChannel(TunerRequest("b", "7.1"));

  broker->CancelQueued(a.ticket_id);
  broker->CancelQueued(a.ticket_id);
  assert(Throws<util::NotFound>([&] { broker->PollQueue(a.ticket_id); }));
  assert(broker->PollQueue(b.ticket_id).position == 1);

  broker->ReleaseSession(holder.session->id);
  assert(broker->PollQueue(b.ticket_id).Granted());
  assert(Throws<util::NotFound>([&] { broker->PollQueue("unknown-ticket"); }));
}

void TestCancelAfterPromotionReleasesSession() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(1));
  auto      holder = broker->RequestChannel(TunerRequest("holder", "10.1"));
  auto      queued = broker->RequestChannel(TunerRequest("late", "5.1"));

  broker->ReleaseSession(holder.session->id);
  auto promoted = broker->PollQueue(queued.ticket_id);
  assert(promoted.Granted());

  broker->CancelQueued(queued.ticket_id);
  assert(Throws<util::SessionNotFound>([&] { broker->GetSession(promoted.session->id); }));
  assert(broker->GetStatus().tuners[0].status == livetv::model::TunerStatus::kAvailable);
}

void TestPromotedSessionLostToFailureReportsRetryable() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(1));
  auto      holder = broker->RequestChannel(TunerRequest("holder", "10.1"));
  auto      queued = broker->RequestChannel(TunerRequest("late", "5.1"));

  broker->ReleaseSession(holder.session->id);
  broker->MarkTunerFailed(1);
  assert(Throws<util::ResourceFailed>([&] { broker->PollQueue(queued.ticket_id); }));
}

void TestCredentialCapacity() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(0, {MakeCredential(1, "acme", 2)}));

  auto a = broker->RequestChannel(CredentialRequest("a", "1001"));
  auto b = broker->RequestChannel(CredentialRequest("b", "1001"));
  auto c = broker->RequestChannel(CredentialRequest("c", "2002"));

  // credentials count connections, they never share
  assert(a.Granted() && b.Granted());
  assert(a.session->id != b.session->id);
  assert(!c.Granted());

  auto capacity = broker->GetCredentialCapacity(1);
  assert(capacity.max == 2 && capacity.used == 2 && capacity.available == 0);

  broker->ReleaseSession(a.session->id);
  auto promoted = broker->PollQueue(c.ticket_id);
  assert(promoted.Granted());
  assert(promoted.session->resource_kind == ResourceKind::kCredential);
  assert(promoted.session->stream_url == "fake://credential/1/2002");

  assert(broker->ReleaseCredentialSessions(1) == 2);
  assert(broker->GetCredentialCapacity(1).used == 0);
  assert(Throws<util::NotFound>([&] { broker->GetCredentialCapacity(9); }));
  assert(Throws<util::NotFound>([&] { broker->ReleaseCredentialSessions(9); }));
  assert(ResourcesConsistent(broker->GetStatus()));
}

void TestCredentialProviderPools() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(0, {MakeCredential(1, "acme", 1), MakeCredential(2, "zeta", 1)}));

  auto acme = broker->RequestChannel(CredentialRequest("a", "100", "acme"));
  assert(acme.session->resource_id == 1);

  auto acme_waiting = broker->RequestChannel(CredentialRequest("b", "101", "acme"));
  assert(!acme_waiting.Granted());

  // any provider falls through to the pool with spare capacity
  auto any = broker->RequestChannel(CredentialRequest("c", "102"));
  assert(any.Granted() && any.session->resource_id == 2);

  assert(Throws<util::NoCapacityConfigured>([&] { broker->RequestChannel(CredentialRequest("d", "103", "missing")); }));
  assert(Throws<util::InvalidChannel>([&] { broker->RequestChannel(CredentialRequest("d", "bad id")); }));

  broker->ReleaseSession(acme.session->id);
  assert(broker->PollQueue(acme_waiting.ticket_id).session->resource_id == 1);
}

void TestCredentialOnlyBrokerRejectsTunerRequests() {
  FakeClock clock;
  auto      broker = MakeBroker(clock, MakeOptions(0, {MakeCredential(1, "acme", 1)}));
  assert(Throws<util::NoCapacityConfigured>([&] { broker->RequestChannel(TunerRequest("a", "10.1")); }));
}

void TestRestoreSessions() {
  FakeClock clock;
  auto      repository = std::make_shared<livetv::db::memory::MemoryRepository>();

  std::string tuner_session;
  std::string credential_session;
  std::string stale_session;
  {
    auto broker        = MakeBroker(clock, MakeOptions(2, {MakeCredential(1, "acme", 2)}), repository);
    stale_session      = broker->RequestChannel(TunerRequest("stale", "5.1")).session->id;
    clock.Advance(std::chrono::seconds(60));
    tuner_session      = broker->RequestChannel(TunerRequest("alice", "10.1")).session->id;
    credential_session = broker->RequestChannel(CredentialRequest("bob", "1001")).session->id;
    // broker goes away without releasing anything
  }

  clock.Advance(std::chrono::seconds(40));

  auto restarted = MakeBroker(clock, MakeOptions(2, {MakeCredential(1, "acme", 2)}), repository);
  assert(restarted->RestoreSessions() == 2);

  assert(restarted->GetSession(tuner_session).user_id == "alice");
  assert(restarted->GetSession(credential_session).user_id == "bob");
  assert(Throws<util::SessionNotFound>([&] { restarted->GetSession(stale_session); }));
  assert(restarted->GetCredentialCapacity(1).used == 1);
  assert(ResourcesConsistent(restarted->GetStatus()));

  // the stale row was removed from the store
  auto tx   = repository->Begin();
  auto rows = repository->ListSessions(*tx);
  tx->Commit();
  assert(rows.size() == 2);

  // restored sessions share like live ones
  auto sharer = restarted->RequestChannel(TunerRequest("carol", "10.1"));
  assert(sharer.session->resource_id == restarted->GetSession(tuner_session).resource_id);
}

} // namespace

int main() {
  TestPriorityBeatsArrivalOrder();
  TestExplicitPriorityOverridesClass();
  TestPromotionDrainsSameChannelWaiters();
  TestQueuedRequestForBusyChannelSharesImmediately();
  TestRetriedQueuedRequestKeepsTicket();
  TestQueueTimeout();
  TestCancelQueued();
  TestCancelAfterPromotionReleasesSession();
  TestPromotedSessionLostToFailureReportsRetryable();
  TestCredentialCapacity();
  TestCredentialProviderPools();
  TestCredentialOnlyBrokerRejectsTunerRequests();
  TestRestoreSessions();

  std::cout << "livetv_unit_tuner_broker_queue: pass\n";
  return 0;
}
