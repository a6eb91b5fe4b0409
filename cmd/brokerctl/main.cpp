#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "livetv/broker/v1.hpp"

using namespace livetv::broker::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  brokerctl <addr> request <user> <channel> [kind=tuner|credential] [class=standard|premium|admin] [provider]\n"
            << "  brokerctl <addr> heartbeat <session_id>\n"
            << "  brokerctl <addr> release <session_id> [user]\n"
            << "  brokerctl <addr> poll <ticket_id>\n"
            << "  brokerctl <addr> cancel <ticket_id>\n"
            << "  brokerctl <addr> session <session_id>\n"
            << "  brokerctl <addr> sessions <user>\n"
            << "  brokerctl <addr> validate <session_id> <channel>\n"
            << "  brokerctl <addr> status\n"
            << "  brokerctl <addr> fail <tuner_id>\n"
            << "  brokerctl <addr> recover <tuner_id>\n"
            << "  brokerctl <addr> maintenance <tuner_id> <on|off>\n"
            << "  brokerctl <addr> release-user <user>\n"
            << "  brokerctl <addr> release-credential <credential_id>\n"
            << "  brokerctl <addr> capacity <credential_id>\n"
            << "  brokerctl <addr> sweep\n"
            << "  brokerctl <addr> history [user] [limit]\n";
}

static std::optional<ResourceKind> ParseKind(const std::string& value) {
  if (value == "tuner") {
    return RESOURCE_KIND_TUNER;
  }
  if (value == "credential") {
    return RESOURCE_KIND_CREDENTIAL;
  }
  return std::nullopt;
}

static std::optional<UserClass> ParseUserClass(const std::string& value) {
  if (value == "standard") {
    return USER_CLASS_STANDARD;
  }
  if (value == "premium") {
    return USER_CLASS_PREMIUM;
  }
  if (value == "admin") {
    return USER_CLASS_ADMIN;
  }
  return std::nullopt;
}

static const char* StatusName(TunerStatus status) {
  switch (status) {
    case TUNER_STATUS_AVAILABLE:
      return "available";
    case TUNER_STATUS_BUSY:
      return "busy";
    case TUNER_STATUS_FAILED:
      return "failed";
    case TUNER_STATUS_MAINTENANCE:
      return "maintenance";
    default:
      return "unknown";
  }
}

static void PrintSession(const StreamSession& session) {
  std::cout << "session=" << session.session_id() << " user=" << session.user_id() << " channel=" << session.channel_key()
            << " kind=" << (session.resource_kind() == RESOURCE_KIND_CREDENTIAL ? "credential" : "tuner")
            << " resource=" << session.resource_id() << " url=" << session.stream_url() << "\n";
}

static void PrintAdmission(const AdmissionResponse& resp) {
  if (resp.has_session()) {
    PrintSession(resp.session());
    return;
  }
  std::cout << "ticket=" << resp.queued().ticket_id() << " position=" << resp.queued().position() << "/" << resp.queued().queue_length()
            << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto broker_stub = TunerBrokerService::NewStub(channel);
  auto admin_stub  = BrokerAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "request") {
    if (argc < 5) return 1;

    RequestChannelRequest req;
    req.set_user_id(argv[3]);
    req.set_channel_key(argv[4]);
    req.set_resource_kind(RESOURCE_KIND_TUNER);

    if (argc >= 6) {
      auto kind = ParseKind(argv[5]);
      if (!kind.has_value()) {
        std::cerr << "unsupported kind: " << argv[5] << "\n";
        return 1;
      }
      req.set_resource_kind(kind.value());
    }
    if (argc >= 7) {
      auto user_class = ParseUserClass(argv[6]);
      if (!user_class.has_value()) {
        std::cerr << "unsupported class: " << argv[6] << "\n";
        return 1;
      }
      req.set_user_class(user_class.value());
    }
    if (argc >= 8) req.set_provider_id(argv[7]);
    req.set_device_type("brokerctl");

    AdmissionResponse resp;

    auto status = broker_stub->RequestChannel(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintAdmission(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "heartbeat") {
    if (argc < 4) return 1;

    HeartbeatRequest req;
    req.set_session_id(argv[3]);

    google::protobuf::Empty resp;

    auto status = broker_stub->Heartbeat(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "alive\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "release") {
    if (argc < 4) return 1;

    ReleaseSessionRequest req;
    req.set_session_id(argv[3]);
    if (argc >= 5) req.set_user_id(argv[4]);

    google::protobuf::Empty resp;

    auto status = broker_stub->ReleaseSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "released\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "poll") {
    if (argc < 4) return 1;

    PollQueueRequest req;
    req.set_ticket_id(argv[3]);

    AdmissionResponse resp;

    auto status = broker_stub->PollQueue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintAdmission(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelQueuedRequest req;
    req.set_ticket_id(argv[3]);

    google::protobuf::Empty resp;

    auto status = broker_stub->CancelQueued(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cancelled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "session") {
    if (argc < 4) return 1;

    GetSessionRequest req;
    req.set_session_id(argv[3]);

    GetSessionResponse resp;

    auto status = broker_stub->GetSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSession(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sessions") {
    if (argc < 4) return 1;

    ListUserSessionsRequest req;
    req.set_user_id(argv[3]);

    ListUserSessionsResponse resp;

    auto status = broker_stub->ListUserSessions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& session : resp.sessions()) PrintSession(session);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "validate") {
    if (argc < 5) return 1;

    ValidateStreamAccessRequest req;
    req.set_session_id(argv[3]);
    req.set_channel_key(argv[4]);

    ValidateStreamAccessResponse resp;

    auto status = broker_stub->ValidateStreamAccess(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "user=" << resp.user_id() << " url=" << resp.stream_url() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetStatusRequest  req;
    GetStatusResponse resp;

    auto status = admin_stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& tuner : resp.tuners()) {
      std::cout << "tuner " << tuner.id() << " " << StatusName(tuner.status()) << " channel=" << tuner.tuned_channel()
                << " sessions=" << tuner.session_ids_size() << " failures=" << tuner.failure_count() << "\n";
    }
    for (const auto& slot : resp.credentials()) {
      std::cout << "credential " << slot.id() << " " << slot.name() << " " << slot.active_connections() << "/" << slot.max_connections()
                << "\n";
    }
    std::cout << "sessions=" << resp.active_sessions_size() << "\n";
    std::cout << "queued=" << resp.queue_length() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "fail" || cmd == "recover") {
    if (argc < 4) return 1;

    TunerRequest req;
    req.set_tuner_id(static_cast<uint32_t>(std::stoul(argv[3])));

    google::protobuf::Empty resp;

    auto status = cmd == "fail" ? admin_stub->MarkTunerFailed(&ctx, req, &resp) : admin_stub->MarkTunerRecovered(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (cmd == "fail" ? "failed\n" : "recovered\n");
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "maintenance") {
    if (argc < 5) return 1;

    const std::string mode = argv[4];
    if (mode != "on" && mode != "off") {
      std::cerr << "expected on|off, got " << mode << "\n";
      return 1;
    }

    SetTunerMaintenanceRequest req;
    req.set_tuner_id(static_cast<uint32_t>(std::stoul(argv[3])));
    req.set_enabled(mode == "on");

    google::protobuf::Empty resp;

    auto status = admin_stub->SetTunerMaintenance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "maintenance " << mode << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "release-user") {
    if (argc < 4) return 1;

    ReleaseUserSessionsRequest req;
    req.set_user_id(argv[3]);

    ReleaseCountResponse resp;

    auto status = admin_stub->ReleaseUserSessions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "released=" << resp.released() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "release-credential") {
    if (argc < 4) return 1;

    ReleaseCredentialSessionsRequest req;
    req.set_credential_id(std::stoull(argv[3]));

    ReleaseCountResponse resp;

    auto status = admin_stub->ReleaseCredentialSessions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "released=" << resp.released() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "capacity") {
    if (argc < 4) return 1;

    GetCredentialCapacityRequest req;
    req.set_credential_id(std::stoull(argv[3]));

    CredentialCapacity resp;

    auto status = admin_stub->GetCredentialCapacity(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "max=" << resp.max() << " used=" << resp.used() << " available=" << resp.available() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sweep") {
    SweepNowRequest  req;
    SweepNowResponse resp;

    auto status = admin_stub->SweepNow(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "expired_sessions=" << resp.expired_sessions() << "\n";
    std::cout << "expired_tickets=" << resp.expired_tickets() << "\n";
    std::cout << "recovered_tuners=" << resp.recovered_tuners() << "\n";
    std::cout << "promoted=" << resp.promoted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    ListViewingHistoryRequest req;
    if (argc >= 4) req.set_user_id(argv[3]);
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    ListViewingHistoryResponse resp;

    auto status = admin_stub->ListViewingHistory(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.user_id() << " " << entry.channel_key() << " " << entry.duration_seconds() << "s reason=" << entry.end_reason()
                << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
