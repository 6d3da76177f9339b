/**
 * @file notifier.hpp
 * @brief INotifier interface and the bundled notifier implementations.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/execution/event.hpp"

namespace stepflow
{

/**
 * @brief Consumer of step lifecycle events.
 *
 * @par Thread Safety
 * - notify() is called concurrently from every running step's thread.
 *   Implementations must synchronize internally.
 *
 * @par Failure handling
 * Returning false (or throwing) reports a delivery failure. The caller logs it
 * and carries on; a notification failure never fails the step and is never
 * retried.
 */
class INotifier
{
public:
    virtual ~INotifier() = default;

    /**
     * @brief Deliver one event.
     * @return True if the event was accepted.
     */
    virtual bool notify(const Event& event) = 0;
};

using NotifierPtr = std::shared_ptr<INotifier>;

/**
 * @brief Writes each event as one spdlog line.
 *
 * @details Terminal failures (RunError, RunFail, RunWaitError, RunTimeout) are
 *          logged at warn level, everything else at info.
 */
class LogNotifier : public INotifier
{
public:
    bool notify(const Event& event) override;
};

/**
 * @brief Keeps every event in memory, in delivery order.
 */
class EventRecorder : public INotifier
{
public:
    bool notify(const Event& event) override;

    /**
     * @brief Snapshot of all events delivered so far.
     */
    std::vector<Event> events() const;

    /**
     * @brief Snapshot of the events whose source is `step_name`.
     */
    std::vector<Event> events_for(const std::string& step_name) const;

    /**
     * @brief Event kinds for one step, in delivery order.
     */
    std::vector<EventKind> kinds_for(const std::string& step_name) const;

    /**
     * @brief Position of the first matching event in the history, if any.
     */
    std::optional<size_t> index_of(const std::string& step_name, EventKind kind) const;

    size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<Event> m_events;
};

} // namespace stepflow
