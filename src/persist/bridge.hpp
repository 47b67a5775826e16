#ifndef _TREEFS_PERSIST_BRIDGE_
#define _TREEFS_PERSIST_BRIDGE_

#include <string>
#include <stdint.h>
#include "../fs/directory.hpp"
#include "../store/kv_store.hpp"
#include "../async/signal_target.hpp"

namespace treefs::persist
{
    enum BRIDGE_STATE
    {
        UNINITIALIZED, // Store connection not requested or not resolved yet.
        CONNECTED,     // Store connected. Tree not loaded yet.
        DEGRADED,      // Store connection failed. Tree usable in memory only.
        LOADED         // Persisted tree loaded into the root.
    };

    constexpr const char *FS_COLLECTION = "files";
    constexpr const char *FS_RECORD_KEY = "fs";
    constexpr const char *ROOT_NAME = "/";
    constexpr const char *HOST_READY_SIGNAL = "ready";
    constexpr uint32_t DEFAULT_CONNECT_TIMEOUT = 5000; // 5 seconds.

    /**
     * Owns a filesystem root and keeps it in sync with a durable store.
     * The whole tree is persisted as a single record.
     */
    class bridge
    {
    private:
        store::kv_store &store;
        const uint32_t connect_timeout_ms;
        fs::directory root;
        BRIDGE_STATE state = BRIDGE_STATE::UNINITIALIZED;
        async::signal_target *host = NULL;
        uint64_t host_listener = 0;
        bool load_pending = false; // Host became ready before the store connected.

        void on_host_ready();
        void release_host();

    public:
        bridge(store::kv_store &store, const uint32_t connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT);
        bridge(const bridge &) = delete;
        bridge &operator=(const bridge &) = delete;
        int init();
        void attach_host(async::signal_target &host);
        int load();
        int save();
        void shutdown();
        fs::directory &get_root();
        BRIDGE_STATE get_state() const;
        ~bridge();
    };

    const char *state_name(const BRIDGE_STATE state);

} // namespace treefs::persist

#endif
