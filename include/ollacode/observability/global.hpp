#pragma once

#include "ollacode/observability/observer.hpp"

#include <memory>

namespace ollacode::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_agent_start(const std::string &model, std::size_t history_size);
void record_agent_end(std::chrono::milliseconds duration, std::size_t iterations,
                      bool cancelled = false);
void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success);
void record_channel_message(const std::string &channel, const std::string &direction);
void record_compaction(std::uint64_t tokens_before, std::uint64_t tokens_after,
                       std::size_t messages_before, std::size_t messages_after);
void record_error(const std::string &component, const std::string &message);

} // namespace ollacode::observability
