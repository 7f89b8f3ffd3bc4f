#include "tg/orchestrator/event_bus.h"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

#include "tg/common.h"
#include "tg/crypto/sha256.h"
#include "tg/security/input_sanitizer.h"

namespace tg::orchestrator {
namespace {

struct EventBusSingletonStorage { // manage singleton lifetime
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() {
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {  // suppress recursive publish deadlocks
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr size_t kMaxEventBytes = 16 * 1024;

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

bool IsPlainNumber(std::string_view value) {
  if (value.empty()) {
    return false;
  }
  double parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  return ec == std::errc() && ptr == value.data() + value.size();
}

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"" + EscapeJson(timestamp) + "\"";
  payload += ",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"" + EscapeJson(event.event_id) + "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"" + EscapeJson(event.message) + "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"" + EscapeJson(field.key) + "\":";
    if (field.numeric && IsPlainNumber(field.value)) {
      payload += field.value;
    } else {
      payload += "\"" + EscapeJson(field.value) + "\"";
    }
  }
  payload += "}";
  return payload;
}

Event BuildOversizeEvent(const Event& original) { // redacted fallback
  Event replacement;
  replacement.category = EventCategory::kDiagnostics;
  replacement.severity = EventSeverity::kWarning;
  replacement.event_id = "event_too_large";
  replacement.message = "Event payload exceeded logger limits";
  if (!original.event_id.empty()) {
    replacement.fields.emplace_back("original_event_id", original.event_id);
  }
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic,
                                  true);
  return replacement;
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return "sha256:" + tg::crypto::SHA256_Hex(input);
}

Event SanitizeEventForSinks(const Event& event) {
  Event sanitized;
  sanitized.category = event.category;
  sanitized.severity = event.severity;
  sanitized.event_id = security::MaskSecrets(event.event_id);
  sanitized.message = security::MaskSecrets(event.message);
  sanitized.fields.reserve(event.fields.size());
  for (const auto& field : event.fields) {
    std::string value;
    switch (field.privacy) {
    case FieldPrivacy::kRedact:
      value = std::string(security::kRedactionMarker);
      break;
    case FieldPrivacy::kHash:
      value = HashForTelemetry(field.value);
      break;
    case FieldPrivacy::kPublic:
      value = security::MaskSecrets(field.value);
      break;
    }
    const bool numeric = field.numeric && field.privacy == FieldPrivacy::kPublic;
    sanitized.fields.emplace_back(security::MaskSecrets(field.key), std::move(value),
                                  FieldPrivacy::kPublic, numeric);
  }
  return sanitized;
}

JsonLineLogger::JsonLineLogger(EventLogOptions options) : options_(std::move(options)) {
  if (options_.max_bytes == 0) {
    options_.max_bytes = kDefaultEventLogMaxBytes;
  }
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = options_.log_path.parent_path();
  if (!parent.empty()) {
    const bool parent_exists = std::filesystem::exists(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"event log directory stat failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      return;
    }
    if (!parent_exists) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"event log directory create failed\",\"error_code\":"
                  << ec.value() << "}" << std::endl;
        return;
      }
      std::filesystem::permissions(parent, std::filesystem::perms::owner_all,
                                   std::filesystem::perm_options::replace, ec);
    }
  }
  stream_.open(options_.log_path, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(options_.log_path, ec);
  if (ec) {
    // A missing log simply has nothing to rotate yet.
    return;
  }
  if (current_size + incoming_bytes <= options_.max_bytes) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  const auto& log_path = options_.log_path;
  for (size_t idx = options_.max_files; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path : std::filesystem::path(log_path.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst = std::filesystem::path(log_path.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    const bool source_exists = std::filesystem::exists(src, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"event log rotation stat failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      continue;
    }
    if (!source_exists) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"event log rotation cleanup failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      rotate_ec.clear();
    }
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"event log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto timestamp = FormatIsoTimestamp(std::chrono::system_clock::now());
  auto line = BuildEventJson(event, timestamp);
  if (line.size() > kMaxEventBytes) {
    line = BuildEventJson(BuildOversizeEvent(event), timestamp);
  }
  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open event log\"}" << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  if (!stream_) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"event log write failed\"}" << std::endl;
    stream_.close();
  }
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([this](const Event& e) {
    std::lock_guard<std::mutex> guard(logger_mutex_);
    if (logger_) {
      logger_->Log(e);
      return;
    }
    if (pending_.size() >= kMaxPendingEvents) {
      pending_.erase(pending_.begin());
      ++pending_dropped_;
    }
    pending_.push_back(e);
  });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  subscribers_snapshot_ = std::move(initial);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() { storage.instance = std::make_unique<EventBus>(); });
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;  // detect recursion
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  const Event sanitized = SanitizeEventForSinks(event);
  std::shared_ptr<const SubscriberList> targets;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    targets = subscribers_snapshot_;
  }
  if (targets) {
    for (const auto& subscriber : *targets) {
      if (subscriber) {
        subscriber(sanitized);
      }
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto updated = subscribers_snapshot_ ? std::make_shared<SubscriberList>(*subscribers_snapshot_)
                                       : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  subscribers_snapshot_ = std::move(updated);
}

void EventBus::ConfigureLogFile(EventLogOptions options) {
  auto logger = std::make_shared<JsonLineLogger>(std::move(options));
  std::lock_guard<std::mutex> guard(logger_mutex_);
  if (pending_dropped_ > 0) {
    Event notice;
    notice.category = EventCategory::kDiagnostics;
    notice.severity = EventSeverity::kWarning;
    notice.event_id = "event_backlog_dropped";
    notice.message = "Events published before log configuration were dropped";
    notice.fields.emplace_back("count", std::to_string(pending_dropped_), FieldPrivacy::kPublic, true);
    logger->Log(notice);
    pending_dropped_ = 0;
  }
  for (const auto& event : pending_) {
    logger->Log(event);
  }
  pending_.clear();
  logger_ = std::move(logger);
}

void PublishEvent(EventCategory category, EventSeverity severity, std::string_view event_id,
                  std::string_view message, std::vector<EventField> fields) noexcept {
  try {
    Event event;
    event.category = category;
    event.severity = severity;
    event.event_id = std::string(event_id);
    event.message = std::string(message);
    event.fields = std::move(fields);
    EventBus::Instance().Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"event_bus_error\",\"message\":\"publish failed\",\"detail\":\""
              << EscapeJson(security::MaskSecrets(ex.what())) << "\"}" << std::endl;
  }
}

void PublishSecurityEvent(std::string_view event_id, std::string_view message,
                          std::vector<EventField> fields, EventSeverity severity) noexcept {
  PublishEvent(EventCategory::kSecurity, severity, event_id, message, std::move(fields));
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

} // namespace tg::orchestrator
