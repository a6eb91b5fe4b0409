#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/model/stream_session.hpp"

namespace livetv::resolver {

/*
  Turns a granted (channel, resource) into a playable URL.

  Called by the broker outside its critical section. Throws
  util::ResourceFailed when the resource cannot be addressed.
*/
class StreamUrlResolver {
 public:
  virtual ~StreamUrlResolver() = default;

  virtual std::string Resolve(const model::StreamSession& session) = 0;
};

struct XtreamAccount {
  std::string server_url;
  std::string username;
  std::string password;
  std::string stream_extension; // "m3u8" when empty
};

struct ResolverOptions {
  std::string hdhomerun_url;
  uint32_t    stream_port = 5004;
  bool        hls_output  = false;

  std::map<uint64_t, XtreamAccount> accounts; // keyed by credential id
};

/*
  HDHomeRun passthrough, local HLS playlist, or Xtream-Codes live URL.
*/
class ConfiguredStreamUrlResolver final : public StreamUrlResolver {
 public:
  explicit ConfiguredStreamUrlResolver(ResolverOptions options);

  std::string Resolve(const model::StreamSession& session) override;

  static std::string HlsPlaylistPath(const std::string& channel_key);
  static std::string PercentEncode(const std::string& value);

 private:
  std::string TunerUrl(const std::string& channel_key) const;
  std::string CredentialUrl(uint64_t credential_id, const std::string& channel_key) const;

  ResolverOptions options_;
  std::string     hdhomerun_host_;
};

} // namespace livetv::resolver
