#pragma once

#include <cstdint>
#include <string>

namespace livetv::model {

/*
  One IPTV login. Connections are counted, never shared per channel.
*/
struct CredentialSlot {
  uint64_t    id = 0;
  std::string provider_id;
  std::string name;
  uint32_t    max_connections    = 0;
  uint32_t    active_connections = 0;

  uint32_t Spare() const {
    return active_connections >= max_connections ? 0 : max_connections - active_connections;
  }
};

} // namespace livetv::model
