#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "livetv/broker/services/v1/broker_admin_service.grpc.pb.h"
#include "livetv/broker/services/v1/tuner_broker_service.grpc.pb.h"
#include "livetv/broker/v1.hpp"

namespace livetv::broker::client {

class BrokerClient {
 public:
  explicit BrokerClient(std::shared_ptr<grpc::Channel> channel);

  // ---------------------------------------------------------------------
  // Viewer
  // ---------------------------------------------------------------------

  arrow::Result<livetv::broker::v1::AdmissionResponse> RequestChannel(const livetv::broker::v1::RequestChannelRequest& request) const;

  arrow::Status Heartbeat(const std::string& session_id) const;
  arrow::Status ReleaseSession(const std::string& session_id, const std::string& user_id = {}) const;

  arrow::Result<livetv::broker::v1::AdmissionResponse> PollQueue(const std::string& ticket_id) const;
  arrow::Status                                        CancelQueued(const std::string& ticket_id) const;

  // Polls a queue ticket until it is promoted. A timeout cancels the ticket.
  arrow::Result<livetv::broker::v1::StreamSession> WaitForSession(const std::string& ticket_id, std::chrono::milliseconds poll_interval,
                                                                  std::chrono::milliseconds timeout) const;

  arrow::Result<livetv::broker::v1::StreamSession>            GetSession(const std::string& session_id) const;
  arrow::Result<livetv::broker::v1::ListUserSessionsResponse> ListUserSessions(const std::string& user_id) const;

  arrow::Result<livetv::broker::v1::ValidateStreamAccessResponse> ValidateStreamAccess(const std::string& session_id,
                                                                                       const std::string& channel_key) const;

  // ---------------------------------------------------------------------
  // Admin
  // ---------------------------------------------------------------------

  arrow::Result<livetv::broker::v1::GetStatusResponse> GetStatus() const;

  arrow::Status MarkTunerFailed(uint32_t tuner_id) const;
  arrow::Status MarkTunerRecovered(uint32_t tuner_id) const;
  arrow::Status SetTunerMaintenance(uint32_t tuner_id, bool enabled) const;

  arrow::Result<uint32_t> ReleaseUserSessions(const std::string& user_id) const;
  arrow::Result<uint32_t> ReleaseCredentialSessions(uint64_t credential_id) const;

  arrow::Result<livetv::broker::v1::CredentialCapacity> GetCredentialCapacity(uint64_t credential_id) const;

  arrow::Result<livetv::broker::v1::SweepNowResponse>           SweepNow() const;
  arrow::Result<livetv::broker::v1::ListViewingHistoryResponse> ListViewingHistory(const std::string& user_id, uint32_t limit = 0) const;

 private:
  std::unique_ptr<livetv::broker::v1::TunerBrokerService::Stub> broker_stub_;
  std::unique_ptr<livetv::broker::v1::BrokerAdminService::Stub> admin_stub_;
};

} // namespace livetv::broker::client
