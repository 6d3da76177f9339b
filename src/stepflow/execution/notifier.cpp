#include "stepflow/execution/notifier.hpp"

#include <spdlog/spdlog.h>

namespace stepflow
{

bool LogNotifier::notify(const Event& event)
{
    switch (event.kind)
    {
        case EventKind::RunError:
        case EventKind::RunFail:
        case EventKind::RunWaitError:
        case EventKind::RunTimeout:
            spdlog::warn("[event] {}", event.to_string());
            break;
        default:
            spdlog::info("[event] {}", event.to_string());
            break;
    }
    return true;
}

bool EventRecorder::notify(const Event& event)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(event);
    return true;
}

std::vector<Event> EventRecorder::events() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

std::vector<Event> EventRecorder::events_for(const std::string& step_name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Event> result;
    for (const auto& event : m_events)
    {
        if (event.source == step_name)
        {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<EventKind> EventRecorder::kinds_for(const std::string& step_name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<EventKind> result;
    for (const auto& event : m_events)
    {
        if (event.source == step_name)
        {
            result.push_back(event.kind);
        }
    }
    return result;
}

std::optional<size_t> EventRecorder::index_of(const std::string& step_name, EventKind kind) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (size_t i = 0; i < m_events.size(); ++i)
    {
        if (m_events[i].source == step_name && m_events[i].kind == kind)
        {
            return i;
        }
    }
    return std::nullopt;
}

size_t EventRecorder::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

void EventRecorder::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
}

} // namespace stepflow
