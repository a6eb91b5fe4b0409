#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"
#include "internal/util/token.hpp"

namespace {

bool IsHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

void TestTokenShape() {
  const std::string token = livetv::util::NewToken();
  assert(token.size() == 36);
  for (size_t i = 0; i < token.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      assert(token[i] == '-');
    } else {
      assert(IsHex(token[i]));
    }
  }
  assert(token[14] == '4');
  assert(token[19] == '8' || token[19] == '9' || token[19] == 'a' || token[19] == 'b');
}

void TestTokensAreDistinct() {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    assert(seen.insert(livetv::util::NewToken()).second);
  }
}

void TestNumberedParamsSkipsQuotedMarks() {
  using livetv::db::sql::NumberedParams;
  assert(NumberedParams("UPDATE t SET a=? WHERE id=?;") == "UPDATE t SET a=$1 WHERE id=$2;");
  assert(NumberedParams("SELECT '?' FROM t WHERE x=?") == "SELECT '?' FROM t WHERE x=$1");
  assert(NumberedParams("SELECT 1") == "SELECT 1");

  const std::string touch = NumberedParams(livetv::db::sql::TOUCH_SESSION);
  assert(touch.find("last_heartbeat_ms=$1") != std::string::npos);
  assert(touch.find("id=$2") != std::string::npos);
}

void TestTimestampKeepsSubSecondPrecision() {
  using namespace livetv::util;
  const TimePoint before = FromUnixMillis(1'700'000'000'123ULL);
  const auto      proto  = ToProto(before);
  assert(proto.seconds() == 1'700'000'000);
  assert(proto.nanos() == 123'000'000);
  assert(ToUnixMillis(FromProto(proto)) == 1'700'000'000'123ULL);
}

void TestDurationFallback() {
  google::protobuf::Duration unset;
  assert(livetv::util::FromProto(unset, std::chrono::milliseconds(30'000)).count() == 30'000);

  google::protobuf::Duration five;
  five.set_seconds(5);
  assert(livetv::util::FromProto(five, std::chrono::milliseconds(30'000)).count() == 5'000);

  google::protobuf::Duration negative;
  negative.set_seconds(-1);
  assert(livetv::util::FromProto(negative, std::chrono::milliseconds(7)).count() == 7);
}

} // namespace

int main() {
  TestTokenShape();
  TestTokensAreDistinct();
  TestNumberedParamsSkipsQuotedMarks();
  TestTimestampKeepsSubSecondPrecision();
  TestDurationFallback();

  std::cout << "livetv_unit_util: pass\n";
  return 0;
}
