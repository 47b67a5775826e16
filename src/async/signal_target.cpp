#include "signal_target.hpp"
#include "../tracelog.hpp"

namespace treefs::async
{
    /**
     * Registers a listener which fires at most once for the given signal.
     * @return Listener id which can be used to remove the listener before it fires.
     */
    uint64_t signal_target::once(std::string_view signal, signal_callback callback)
    {
        std::scoped_lock lock(listeners_mutex);
        const uint64_t id = next_id++;
        listeners.push_back(listener{id, std::string(signal), std::move(callback)});
        return id;
    }

    /**
     * Removes a listener that has not fired yet.
     * @return true if the listener was found and removed.
     */
    bool signal_target::remove(const uint64_t id)
    {
        std::scoped_lock lock(listeners_mutex);
        for (auto itr = listeners.begin(); itr != listeners.end(); itr++)
        {
            if (itr->id == id)
            {
                listeners.erase(itr);
                return true;
            }
        }
        return false;
    }

    /**
     * Fires all listeners registered for the signal and discards them.
     * @return Number of listeners that fired.
     */
    int signal_target::emit(std::string_view signal, std::string_view detail)
    {
        std::list<listener> fired;
        {
            std::scoped_lock lock(listeners_mutex);
            for (auto itr = listeners.begin(); itr != listeners.end();)
            {
                auto current = itr++;
                if (current->signal == signal)
                    fired.splice(fired.end(), listeners, current);
            }
        }

        LOG_DEBUG << "Signal '" << signal << "' fired " << fired.size() << " listeners.";

        for (listener &l : fired)
            l.callback(signal, detail);

        return fired.size();
    }

    size_t signal_target::listener_count()
    {
        std::scoped_lock lock(listeners_mutex);
        return listeners.size();
    }

} // namespace treefs::async
