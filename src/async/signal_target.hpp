#ifndef _TREEFS_ASYNC_SIGNAL_TARGET_
#define _TREEFS_ASYNC_SIGNAL_TARGET_

#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <stdint.h>

namespace treefs::async
{
    typedef std::function<void(std::string_view signal, std::string_view detail)> signal_callback;

    /**
     * Dispatches named signals to one-shot listeners. Listeners may be registered,
     * removed and fired from any thread. Callbacks run on the emitting thread,
     * outside the internal lock.
     */
    class signal_target
    {
    private:
        struct listener
        {
            uint64_t id;
            std::string signal;
            signal_callback callback;
        };

        std::mutex listeners_mutex;
        std::list<listener> listeners;
        uint64_t next_id = 1;

    public:
        signal_target() = default;
        signal_target(const signal_target &) = delete;
        signal_target &operator=(const signal_target &) = delete;

        uint64_t once(std::string_view signal, signal_callback callback);
        bool remove(const uint64_t id);
        int emit(std::string_view signal, std::string_view detail = {});
        size_t listener_count();
    };

} // namespace treefs::async

#endif
