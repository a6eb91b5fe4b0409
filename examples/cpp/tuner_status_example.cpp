#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/broker_client.h"
#include "livetv/broker/v1.hpp"

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  livetv::broker::client::BrokerClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  auto status = client.GetStatus();
  if (!status.ok()) {
    std::cerr << "GetStatus failed: " << status.status().ToString() << '\n';
    return 1;
  }

  for (const auto& tuner : status->tuners()) {
    std::cout << "tuner " << tuner.id() << ": " << livetv::broker::v1::TunerStatus_Name(tuner.status());
    if (!tuner.tuned_channel().empty()) {
      std::cout << " channel " << tuner.tuned_channel() << " (" << tuner.session_ids_size() << " viewers)";
    }
    std::cout << '\n';
  }

  for (const auto& slot : status->credentials()) {
    auto capacity = client.GetCredentialCapacity(slot.id());
    if (!capacity.ok()) {
      std::cerr << "GetCredentialCapacity failed: " << capacity.status().ToString() << '\n';
      return 1;
    }
    std::cout << "credential " << slot.name() << ": " << capacity->used() << "/" << capacity->max() << " in use\n";
  }

  std::cout << status->queue_length() << " waiting\n";

  auto history = client.ListViewingHistory("", 10);
  if (!history.ok()) {
    std::cerr << "ListViewingHistory failed: " << history.status().ToString() << '\n';
    return 1;
  }
  for (const auto& entry : history->entries()) {
    std::cout << entry.user_id() << " watched " << entry.channel_key() << " for " << entry.duration_seconds() << "s ("
              << livetv::broker::v1::EndReason_Name(entry.end_reason()) << ")\n";
  }
  return 0;
}
