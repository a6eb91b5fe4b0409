#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "client/cpp/broker_client.h"
#include "livetv/broker/v1.hpp"

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target  = argc > 1 ? argv[1] : "localhost:50051";
  const std::string channel = argc > 2 ? argv[2] : "5.1";

  livetv::broker::client::BrokerClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  livetv::broker::v1::RequestChannelRequest request;
  request.set_user_id("example-viewer");
  request.set_channel_key(channel);
  request.set_resource_kind(livetv::broker::v1::RESOURCE_KIND_TUNER);
  request.set_user_class(livetv::broker::v1::USER_CLASS_STANDARD);
  request.set_device_type("example");

  auto admission = client.RequestChannel(request);
  if (!admission.ok()) {
    std::cerr << "RequestChannel failed: " << admission.status().ToString() << '\n';
    return 1;
  }

  // Every tuner busy on another channel: wait in line for up to a minute.
  livetv::broker::v1::StreamSession session;
  if (admission->has_session()) {
    session = admission->session();
  } else {
    std::cout << "queued at position " << admission->queued().position() << " of " << admission->queued().queue_length() << '\n';
    auto promoted = client.WaitForSession(admission->queued().ticket_id(), std::chrono::seconds(2), std::chrono::minutes(1));
    if (!promoted.ok()) {
      std::cerr << "WaitForSession failed: " << promoted.status().ToString() << '\n';
      return 1;
    }
    session = promoted.ValueOrDie();
  }

  std::cout << "watching " << session.channel_key() << " on tuner " << session.resource_id() << " at " << session.stream_url() << '\n';

  // A player heartbeats well inside the stale threshold.
  for (int i = 0; i < 3; ++i) {
    std::this_thread::sleep_for(std::chrono::seconds(5));
    auto status = client.Heartbeat(session.session_id());
    if (!status.ok()) {
      std::cerr << "Heartbeat failed: " << status.ToString() << '\n';
      return 1;
    }
  }

  auto release_status = client.ReleaseSession(session.session_id(), session.user_id());
  if (!release_status.ok()) {
    std::cerr << "ReleaseSession failed: " << release_status.ToString() << '\n';
    return 1;
  }

  std::cout << "released " << session.session_id() << '\n';
  return 0;
}
