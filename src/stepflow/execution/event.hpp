/**
 * @file event.hpp
 * @brief Immutable lifecycle record for one step.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/stepflow_enums.hpp"

namespace stepflow
{

/**
 * @brief A lifecycle occurrence for one step.
 *
 * @details
 * Events are produced by ProcessRunner and handed to an INotifier. The
 * scheduler never reads them back; scheduling decisions are driven only by
 * step status.
 *
 * `payload` is set only for `RunFail`, where it holds the raw exit status.
 */
struct Event
{
    std::string source;
    EventKind kind;
    std::optional<int> payload;
    std::chrono::system_clock::time_point timestamp;

    /**
     * @brief Human readable form, e.g. `build: RunFail(2)`.
     */
    std::string to_string() const
    {
        std::string result = source + ": " + stepflow::to_string(kind);
        if (payload)
        {
            result += "(" + std::to_string(*payload) + ")";
        }
        return result;
    }
};

/**
 * @brief Create an event stamped with the current time.
 */
inline Event make_event(const std::string& source, EventKind kind,
                        std::optional<int> payload = std::nullopt)
{
    return Event{source, kind, payload, std::chrono::system_clock::now()};
}

} // namespace stepflow
