#pragma once

#include "livetv/broker/v1.hpp"
#include "service_context.hpp"

namespace livetv::service {

/*
  Viewer-facing admission API over the broker.
*/
class BrokerService {
 public:
  explicit BrokerService(ServiceContext ctx);

  livetv::broker::v1::AdmissionResponse RequestChannel(const livetv::broker::v1::RequestChannelRequest& req);
  void                                  Heartbeat(const livetv::broker::v1::HeartbeatRequest& req);
  void                                  ReleaseSession(const livetv::broker::v1::ReleaseSessionRequest& req);

  livetv::broker::v1::AdmissionResponse PollQueue(const livetv::broker::v1::PollQueueRequest& req);
  void                                  CancelQueued(const livetv::broker::v1::CancelQueuedRequest& req);

  livetv::broker::v1::GetSessionResponse           GetSession(const livetv::broker::v1::GetSessionRequest& req);
  livetv::broker::v1::ListUserSessionsResponse     ListUserSessions(const livetv::broker::v1::ListUserSessionsRequest& req);
  livetv::broker::v1::ValidateStreamAccessResponse ValidateStreamAccess(const livetv::broker::v1::ValidateStreamAccessRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace livetv::service
