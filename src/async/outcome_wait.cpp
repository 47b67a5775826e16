#include <chrono>
#include "outcome_wait.hpp"
#include "../tracelog.hpp"

namespace treefs::async
{
    /**
     * @param target Signal target to listen on.
     * @param success_signals Signals that resolve the wait successfully.
     * @param failure_signals Signals that resolve the wait as failed.
     */
    outcome_wait::outcome_wait(signal_target &target,
                               const std::vector<std::string> &success_signals,
                               const std::vector<std::string> &failure_signals) : target(target),
                                                                                  state(std::make_shared<wait_state>())
    {
        // Listeners hold the shared state so a late signal on another thread never
        // touches a destroyed wait.
        const auto make_listener = [state = state](const OUTCOME type) {
            return [state, type](std::string_view signal, std::string_view detail) {
                {
                    std::scoped_lock lock(state->mutex);
                    if (state->result.type != OUTCOME::PENDING)
                        return; // Already decided.

                    state->result.type = type;
                    state->result.signal = signal;
                    state->result.detail = detail;
                }
                state->cv.notify_all();
            };
        };

        for (const std::string &signal : success_signals)
            listener_ids.push_back(target.once(signal, make_listener(OUTCOME::SUCCESS)));

        for (const std::string &signal : failure_signals)
            listener_ids.push_back(target.once(signal, make_listener(OUTCOME::FAILURE)));
    }

    /**
     * Blocks until one of the registered signals fires or the timeout elapses.
     * @param timeout_ms Max time to wait in milliseconds. Waits indefinitely if not given.
     * @return The decided outcome. Subsequent calls return the same outcome.
     */
    const outcome outcome_wait::wait(const std::optional<uint32_t> timeout_ms)
    {
        outcome result;
        {
            std::unique_lock lock(state->mutex);
            const auto decided = [this] { return state->result.type != OUTCOME::PENDING; };

            if (timeout_ms.has_value())
            {
                if (!state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms.value()), decided))
                {
                    state->result.type = OUTCOME::TIMEOUT;
                    state->result.detail = "Timeout";
                    LOG_DEBUG << "Outcome wait timed out after " << timeout_ms.value() << "ms.";
                }
            }
            else
            {
                state->cv.wait(lock, decided);
            }

            result = state->result;
        }

        // The wait is decided. Listeners which did not fire are no longer needed.
        release_listeners();
        return result;
    }

    void outcome_wait::release_listeners()
    {
        for (const uint64_t id : listener_ids)
            target.remove(id);
        listener_ids.clear();
    }

    outcome_wait::~outcome_wait()
    {
        release_listeners();
    }

    /**
     * Registers an outcome wait on the target, runs the trigger which is expected to
     * cause one of the signals and waits for the outcome.
     */
    const outcome await_outcome(signal_target &target, const std::vector<std::string> &success_signals,
                                const std::vector<std::string> &failure_signals, const std::optional<uint32_t> timeout_ms,
                                const std::function<void()> &trigger)
    {
        outcome_wait wait(target, success_signals, failure_signals);
        if (trigger)
            trigger();
        return wait.wait(timeout_ms);
    }

    const char *outcome_name(const OUTCOME type)
    {
        switch (type)
        {
        case OUTCOME::PENDING:
            return "pending";
        case OUTCOME::SUCCESS:
            return "success";
        case OUTCOME::FAILURE:
            return "failure";
        case OUTCOME::TIMEOUT:
            return "timeout";
        default:
            return "unknown";
        }
    }

} // namespace treefs::async
