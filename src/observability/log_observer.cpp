#include "ollacode/observability/log_observer.hpp"

#include "ollacode/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace ollacode::observability {

namespace {

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

LogLevel parse_log_level(const std::string &text) {
  const std::string normalized = common::to_lower(common::trim(text));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Warn;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AgentStartEvent>) {
          log_line(LogLevel::Info, "agent.start model=" + evt.model +
                                       " history=" + std::to_string(evt.history_size));
        } else if constexpr (std::is_same_v<T, AgentEndEvent>) {
          log_line(LogLevel::Info, "agent.end duration_ms=" + std::to_string(evt.duration.count()) +
                                       " iterations=" + std::to_string(evt.iterations) +
                                       (evt.cancelled ? " cancelled=true" : ""));
        } else if constexpr (std::is_same_v<T, ToolCallEvent>) {
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn,
                   "tool.call name=" + evt.tool +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + (evt.success ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, ChannelMessageEvent>) {
          log_line(LogLevel::Debug,
                   "channel.message channel=" + evt.channel + " direction=" + evt.direction);
        } else if constexpr (std::is_same_v<T, CompactionEvent>) {
          log_line(LogLevel::Info, "history.compact tokens=" + std::to_string(evt.tokens_before) +
                                       "->" + std::to_string(evt.tokens_after) +
                                       " messages=" + std::to_string(evt.messages_before) + "->" +
                                       std::to_string(evt.messages_after));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          log_line(LogLevel::Debug, "metric.tokens prompt=" + std::to_string(m.prompt_tokens) +
                                        " completion=" + std::to_string(m.completion_tokens));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace ollacode::observability
