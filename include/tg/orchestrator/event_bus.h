#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tg::orchestrator {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  // "sha256:<hex>" digest used for kHash fields; empty input stays empty.
  std::string HashForTelemetry(std::string_view input);

  // Applies field privacy and secret masking. Every subscriber receives the
  // output of this function, never the raw event.
  [[nodiscard]] Event SanitizeEventForSinks(const Event& event);

  inline constexpr size_t kDefaultEventLogMaxBytes = 10 * 1024 * 1024;
  inline constexpr std::string_view kEventLogFileName{"security-events.jsonl"};
  // Events held until a log file is configured; the oldest are dropped first.
  inline constexpr size_t kMaxPendingEvents = 256;

  struct EventLogOptions {
    std::filesystem::path log_path;
    size_t max_bytes{kDefaultEventLogMaxBytes};
    size_t max_files{3};
  };

  class JsonLineLogger {
  public:
    explicit JsonLineLogger(EventLogOptions options);
    void Log(const Event& event);
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return options_.log_path; }

  private:
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    EventLogOptions options_;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    EventBus();
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    // Installs the JSON line sink. Events published before the first call
    // are written to it first.
    void ConfigureLogFile(EventLogOptions options);

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
    std::shared_ptr<JsonLineLogger> logger_;
    std::vector<Event> pending_;
    size_t pending_dropped_{0};
    std::mutex logger_mutex_;
  };

  // Safeguards report through these helpers; they never throw.
  void PublishEvent(EventCategory category, EventSeverity severity, std::string_view event_id,
                    std::string_view message, std::vector<EventField> fields = {}) noexcept;
  void PublishSecurityEvent(std::string_view event_id, std::string_view message,
                            std::vector<EventField> fields = {},
                            EventSeverity severity = EventSeverity::kWarning) noexcept;

  void ResetEventBusForTesting();

} // namespace tg::orchestrator
