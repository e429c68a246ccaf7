#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ollacode::observability {

struct AgentStartEvent {
  std::string model;
  std::size_t history_size = 0;
};

struct AgentEndEvent {
  std::chrono::milliseconds duration{0};
  std::size_t iterations = 0;
  bool cancelled = false;
};

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ChannelMessageEvent {
  std::string channel;
  std::string direction;
};

struct CompactionEvent {
  std::uint64_t tokens_before = 0;
  std::uint64_t tokens_after = 0;
  std::size_t messages_before = 0;
  std::size_t messages_after = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<AgentStartEvent, AgentEndEvent, ToolCallEvent,
                                   ChannelMessageEvent, CompactionEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensUsedMetric {
  std::uint64_t prompt_tokens = 0;
  std::uint64_t completion_tokens = 0;
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, TokensUsedMetric, ActiveSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace ollacode::observability
