#ifndef _TREEFS_ASYNC_OUTCOME_WAIT_
#define _TREEFS_ASYNC_OUTCOME_WAIT_

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "signal_target.hpp"

namespace treefs::async
{
    enum OUTCOME
    {
        PENDING,
        SUCCESS,
        FAILURE,
        TIMEOUT
    };

    struct outcome
    {
        OUTCOME type = OUTCOME::PENDING;
        std::string signal; // The signal which decided the outcome. Empty on timeout.
        std::string detail;
    };

    /**
     * Races a set of success signals against a set of failure signals and an optional
     * timeout. Listeners are registered on construction so signals emitted any time
     * after construction are captured. The first signal to arrive decides the outcome.
     */
    class outcome_wait
    {
    private:
        struct wait_state
        {
            std::mutex mutex;
            std::condition_variable cv;
            outcome result;
        };

        signal_target &target;
        std::shared_ptr<wait_state> state;
        std::vector<uint64_t> listener_ids;

        void release_listeners();

    public:
        outcome_wait(signal_target &target, const std::vector<std::string> &success_signals,
                     const std::vector<std::string> &failure_signals);
        outcome_wait(const outcome_wait &) = delete;
        outcome_wait &operator=(const outcome_wait &) = delete;
        const outcome wait(const std::optional<uint32_t> timeout_ms = std::nullopt);
        ~outcome_wait();
    };

    const outcome await_outcome(signal_target &target, const std::vector<std::string> &success_signals,
                                const std::vector<std::string> &failure_signals, const std::optional<uint32_t> timeout_ms,
                                const std::function<void()> &trigger);
    const char *outcome_name(const OUTCOME type);

} // namespace treefs::async

#endif
