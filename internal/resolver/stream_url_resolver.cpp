#include "stream_url_resolver.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace livetv::resolver {

namespace {

// "http://10.0.0.5:80/path" -> "10.0.0.5"
std::string ExtractHost(const std::string& url) {
  std::string rest = url;
  if (auto scheme = rest.find("://"); scheme != std::string::npos) {
    rest = rest.substr(scheme + 3);
  }
  if (auto slash = rest.find('/'); slash != std::string::npos) {
    rest = rest.substr(0, slash);
  }
  if (!rest.empty() && rest.front() == '[') {
    // IPv6 literal keeps its brackets
    auto close = rest.find(']');
    return close == std::string::npos ? rest : rest.substr(0, close + 1);
  }
  if (auto colon = rest.find(':'); colon != std::string::npos) {
    rest = rest.substr(0, colon);
  }
  return rest;
}

std::string TrimTrailingSlash(std::string value) {
  while (!value.empty() && value.back() == '/') value.pop_back();
  return value;
}

} // namespace

ConfiguredStreamUrlResolver::ConfiguredStreamUrlResolver(ResolverOptions options)
    : options_(std::move(options)), hdhomerun_host_(ExtractHost(options_.hdhomerun_url)) {
  if (options_.stream_port == 0) options_.stream_port = 5004;
}

std::string ConfiguredStreamUrlResolver::Resolve(const model::StreamSession& session) {
  switch (session.resource_kind) {
    case model::ResourceKind::kTuner:
      return TunerUrl(session.channel_key);
    case model::ResourceKind::kCredential:
      return CredentialUrl(session.resource_id, session.channel_key);
  }
  throw util::ResourceFailed("resolve: unknown resource kind");
}

std::string ConfiguredStreamUrlResolver::TunerUrl(const std::string& channel_key) const {
  if (options_.hls_output) {
    return HlsPlaylistPath(channel_key);
  }
  if (hdhomerun_host_.empty()) {
    throw util::ResourceFailed("resolve: no HDHomeRun device configured");
  }
  return "http://" + hdhomerun_host_ + ":" + std::to_string(options_.stream_port) + "/auto/v" + channel_key;
}

std::string ConfiguredStreamUrlResolver::CredentialUrl(uint64_t credential_id, const std::string& channel_key) const {
  auto it = options_.accounts.find(credential_id);
  if (it == options_.accounts.end() || it->second.server_url.empty()) {
    throw util::ResourceFailed("resolve: credential " + std::to_string(credential_id) + " has no server configured");
  }

  const auto& account   = it->second;
  const auto  extension = account.stream_extension.empty() ? std::string("m3u8") : account.stream_extension;
  return TrimTrailingSlash(account.server_url) + "/live/" + PercentEncode(account.username) + "/" + PercentEncode(account.password) + "/" +
         channel_key + "." + extension;
}

std::string ConfiguredStreamUrlResolver::HlsPlaylistPath(const std::string& channel_key) {
  std::string safe = channel_key;
  std::replace(safe.begin(), safe.end(), '.', '_');
  return "/streams/channel_" + safe + "/playlist.m3u8";
}

std::string ConfiguredStreamUrlResolver::PercentEncode(const std::string& value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

} // namespace livetv::resolver
