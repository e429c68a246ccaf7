#include "ollacode/observability/global.hpp"

#include <mutex>

namespace ollacode::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->record_metric(metric);
  }
}

void record_agent_start(const std::string &model, const std::size_t history_size) {
  record_event(AgentStartEvent{.model = model, .history_size = history_size});
}

void record_agent_end(const std::chrono::milliseconds duration, const std::size_t iterations,
                      const bool cancelled) {
  record_event(
      AgentEndEvent{.duration = duration, .iterations = iterations, .cancelled = cancelled});
}

void record_tool_call(const std::string &tool, const std::chrono::milliseconds duration,
                      const bool success) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .success = success});
}

void record_channel_message(const std::string &channel, const std::string &direction) {
  record_event(ChannelMessageEvent{.channel = channel, .direction = direction});
}

void record_compaction(const std::uint64_t tokens_before, const std::uint64_t tokens_after,
                       const std::size_t messages_before, const std::size_t messages_after) {
  record_event(CompactionEvent{.tokens_before = tokens_before,
                               .tokens_after = tokens_after,
                               .messages_before = messages_before,
                               .messages_after = messages_after});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace ollacode::observability
