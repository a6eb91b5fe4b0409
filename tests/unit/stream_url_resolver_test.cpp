#include "internal/resolver/stream_url_resolver.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/broker_fixtures.hpp"

namespace {

using livetv::model::ResourceKind;
using livetv::model::StreamSession;
using livetv::resolver::ConfiguredStreamUrlResolver;
using livetv::resolver::ResolverOptions;
using livetv::resolver::XtreamAccount;
using livetv::testing::Throws;

namespace util = livetv::util;

StreamSession Session(ResourceKind kind, uint64_t resource_id, const std::string& channel_key) {
  StreamSession session;
  session.id            = "s";
  session.resource_kind = kind;
  session.resource_id   = resource_id;
  session.channel_key   = channel_key;
  session.user_id       = "alice";
  return session;
}

void TestHdhomerunPassthrough() {
  ResolverOptions options;
  options.hdhomerun_url = "http://192.168.1.50:80/discover.json";

  ConfiguredStreamUrlResolver resolver(options);
  assert(resolver.Resolve(Session(ResourceKind::kTuner, 1, "10.1")) == "http://192.168.1.50:5004/auto/v10.1");

  options.hdhomerun_url = "192.168.1.60";
  options.stream_port   = 0;
  ConfiguredStreamUrlResolver bare(options);
  assert(bare.Resolve(Session(ResourceKind::kTuner, 2, "7")) == "http://192.168.1.60:5004/auto/v7");

  options.hdhomerun_url = "http://[fe80::1]:8080";
  options.stream_port   = 5005;
  ConfiguredStreamUrlResolver v6(options);
  assert(v6.Resolve(Session(ResourceKind::kTuner, 1, "4.2")) == "http://[fe80::1]:5005/auto/v4.2");
}

void TestHlsOutput() {
  ResolverOptions options;
  options.hls_output = true;

  ConfiguredStreamUrlResolver resolver(options);
  assert(resolver.Resolve(Session(ResourceKind::kTuner, 1, "10.1")) == "/streams/channel_10_1/playlist.m3u8");
  assert(ConfiguredStreamUrlResolver::HlsPlaylistPath("5") == "/streams/channel_5/playlist.m3u8");
}

void TestXtreamUrl() {
  ResolverOptions options;
  options.accounts[7] = XtreamAccount{"http://iptv.example.com:8080/", "user one", "p@ss/word", ""};
  options.accounts[8] = XtreamAccount{"https://other.example.com", "u", "p", "ts"};

  ConfiguredStreamUrlResolver resolver(options);
  assert(resolver.Resolve(Session(ResourceKind::kCredential, 7, "12345")) ==
         "http://iptv.example.com:8080/live/user%20one/p%40ss%2Fword/12345.m3u8");
  assert(resolver.Resolve(Session(ResourceKind::kCredential, 8, "99")) == "https://other.example.com/live/u/p/99.ts");
}

void TestPercentEncodeKeepsUnreserved() {
  assert(ConfiguredStreamUrlResolver::PercentEncode("AZaz09-_.~") == "AZaz09-_.~");
  assert(ConfiguredStreamUrlResolver::PercentEncode("a b+c") == "a%20b%2Bc");
  assert(ConfiguredStreamUrlResolver::PercentEncode("") == "");
}

void TestUnaddressableResourcesFail() {
  ConfiguredStreamUrlResolver resolver(ResolverOptions{});

  assert(Throws<util::ResourceFailed>([&] { resolver.Resolve(Session(ResourceKind::kTuner, 1, "10.1")); }));
  assert(Throws<util::ResourceFailed>([&] { resolver.Resolve(Session(ResourceKind::kCredential, 3, "1")); }));

  ResolverOptions options;
  options.accounts[3] = XtreamAccount{"", "u", "p", ""};
  ConfiguredStreamUrlResolver no_server(options);
  assert(Throws<util::ResourceFailed>([&] { no_server.Resolve(Session(ResourceKind::kCredential, 3, "1")); }));
}

} // namespace

int main() {
  TestHdhomerunPassthrough();
  TestHlsOutput();
  TestXtreamUrl();
  TestPercentEncodeKeepsUnreserved();
  TestUnaddressableResourcesFail();

  std::cout << "livetv_unit_stream_url_resolver: pass\n";
  return 0;
}
