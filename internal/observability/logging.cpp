#include "internal/observability/logging.hpp"

#include <array>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace livetv::observability {
namespace {

constexpr const char*      kLoggerName = "livetv-broker";
constexpr std::string_view kRedacted   = "***";

bool g_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

spdlog::level::level_enum ParseLevel(std::string_view name, spdlog::level::level_enum fallback) {
  const auto parsed = spdlog::level::from_str(std::string(name));
  if (parsed == spdlog::level::off && name != "off") {
    return fallback;
  }
  return parsed;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\\' || static_cast<unsigned char>(c) < 0x20) return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }

  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const std::array<uint8_t, N>& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(N * 2);
  for (auto b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  std::array<uint8_t, 16> trace_id{};
  std::array<uint8_t, 8>  span_id{};
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  line.append(" trace_id=").append(Hex(trace_id));
  line.append(" span_id=").append(Hex(span_id));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField MillisField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

LogField UrlField(std::string_view key, std::string_view url) {
  return {std::string(key), RedactUrl(url)};
}

std::string RedactUrl(std::string_view url) {
  std::string out(url);
  std::size_t path_start = 0;

  const auto scheme_end = out.find("://");
  if (scheme_end != std::string::npos) {
    const auto authority = scheme_end + 3;
    auto       host_end  = out.find_first_of("/?#", authority);
    if (host_end == std::string::npos) host_end = out.size();

    const auto at = out.find('@', authority);
    if (at != std::string::npos && at < host_end) {
      out.replace(authority, at - authority, kRedacted);
      host_end = out.find_first_of("/?#", authority);
      if (host_end == std::string::npos) host_end = out.size();
    }
    path_start = host_end;
  }

  // Xtream paths: /live/<user>/<pass>/<stream>, same for movie and series
  for (std::string_view prefix : {"/live/", "/movie/", "/series/"}) {
    const auto pos = out.find(prefix, path_start);
    if (pos == std::string::npos) continue;

    auto segment = pos + prefix.size();
    for (int i = 0; i < 2; ++i) {
      const auto end = out.find('/', segment);
      if (end == std::string::npos) break;
      out.replace(segment, end - segment, kRedacted);
      segment += kRedacted.size() + 1;
    }
    break;
  }
  return out;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key).push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

LogSettings ResolveLogSettings(const livetv::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  if (!logging.level().empty()) settings.level = ParseLevel(logging.level(), settings.level);
  if (!logging.pattern().empty()) settings.pattern = logging.pattern();
  settings.trace_context = logging.include_trace_context();

  settings.file_path = logging.file_path();
  if (logging.max_file_size_mb() > 0) settings.max_file_bytes = static_cast<std::size_t>(logging.max_file_size_mb()) * 1024 * 1024;
  if (logging.max_files() > 0) settings.max_files = logging.max_files();

  if (const char* level = Env("LIVETV_LOG_LEVEL")) settings.level = ParseLevel(level, settings.level);
  if (const char* pattern = Env("LIVETV_LOG_PATTERN")) settings.pattern = pattern;
  if (const char* trace = Env("LIVETV_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string_view flag(trace);
    settings.trace_context = flag == "1" || flag == "true";
  }
  return settings;
}

void InitializeLogging(const LogSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!settings.file_path.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(settings.file_path, settings.max_file_bytes, settings.max_files));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_trace_context = settings.trace_context;
}

void InitializeLogging(const livetv::runtime::config::RuntimeConfig& config) {
  InitializeLogging(ResolveLogSettings(config));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  if (fields.size() > 0) {
    line.push_back(' ');
    line.append(FormatFields(fields));
  }
  if (g_trace_context) {
    AppendTraceContext(line);
  }
  spdlog::log(level, "{}", line);
}

} // namespace livetv::observability
