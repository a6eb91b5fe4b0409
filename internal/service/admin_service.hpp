#pragma once

#include "livetv/broker/v1.hpp"
#include "service_context.hpp"

namespace livetv::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  livetv::broker::v1::GetStatusResponse GetStatus(const livetv::broker::v1::GetStatusRequest& req);

  void MarkTunerFailed(const livetv::broker::v1::TunerRequest& req);
  void MarkTunerRecovered(const livetv::broker::v1::TunerRequest& req);
  void SetTunerMaintenance(const livetv::broker::v1::SetTunerMaintenanceRequest& req);

  livetv::broker::v1::ReleaseCountResponse ReleaseUserSessions(const livetv::broker::v1::ReleaseUserSessionsRequest& req);
  livetv::broker::v1::ReleaseCountResponse ReleaseCredentialSessions(const livetv::broker::v1::ReleaseCredentialSessionsRequest& req);
  livetv::broker::v1::CredentialCapacity GetCredentialCapacity(const livetv::broker::v1::GetCredentialCapacityRequest& req);

  livetv::broker::v1::SweepNowResponse SweepNow(const livetv::broker::v1::SweepNowRequest& req);
  livetv::broker::v1::ListViewingHistoryResponse ListViewingHistory(const livetv::broker::v1::ListViewingHistoryRequest& req);

private:
  ServiceContext ctx_;
};

}
