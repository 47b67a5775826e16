#include <memory>
#include <vector>
#include "bridge.hpp"
#include "../async/outcome_wait.hpp"
#include "../codec/tree_codec.hpp"
#include "../tracelog.hpp"

namespace treefs::persist
{
    bridge::bridge(store::kv_store &store, const uint32_t connect_timeout_ms) : store(store),
                                                                                connect_timeout_ms(connect_timeout_ms),
                                                                                root(ROOT_NAME)
    {
    }

    /**
     * Opens the store and waits for the connection outcome.
     * Connection failure or timeout puts the bridge in degraded mode where the tree
     * remains usable but is never persisted. There is no automatic retry. Calling
     * init() again from degraded mode makes a fresh connection attempt.
     * @return 0 if connected. -1 if the store is unavailable.
     */
    int bridge::init()
    {
        if (state == BRIDGE_STATE::CONNECTED || state == BRIDGE_STATE::LOADED)
            return 0;

        LOG_DEBUG << "Connecting to store... (timeout:" << connect_timeout_ms << "ms)";

        const async::outcome res = async::await_outcome(store.signals(),
                                                        {store::SIGNAL_OPEN_SUCCESS},
                                                        {store::SIGNAL_OPEN_ERROR},
                                                        connect_timeout_ms,
                                                        [&] { store.open(); });

        if (res.type != async::OUTCOME::SUCCESS)
        {
            state = BRIDGE_STATE::DEGRADED;
            LOG_ERROR << "Failed to open store (" << async::outcome_name(res.type) << ": " << res.detail
                      << "). Filesystem will not be persisted.";
            return -1;
        }

        state = BRIDGE_STATE::CONNECTED;
        LOG_INFO << "Store connected.";

        if (load_pending)
        {
            load_pending = false;
            if (load() == -1)
                LOG_ERROR << "Deferred filesystem load failed.";
        }

        return 0;
    }

    /**
     * Loads the persisted tree when the host signals that it is ready.
     * The load happens at most once for the attached host. If the host is ready before
     * the store connection is established, the load runs when init() connects.
     */
    void bridge::attach_host(async::signal_target &host)
    {
        release_host();

        this->host = &host;
        host_listener = host.once(HOST_READY_SIGNAL, [this](std::string_view, std::string_view) {
            host_listener = 0;
            on_host_ready();
        });
    }

    void bridge::on_host_ready()
    {
        if (state == BRIDGE_STATE::CONNECTED)
        {
            if (load() == -1)
                LOG_ERROR << "Filesystem load on host ready failed.";
        }
        else if (state == BRIDGE_STATE::LOADED)
        {
            LOG_DEBUG << "Host ready. Filesystem already loaded.";
        }
        else
        {
            // Not connected yet, or degraded. A later successful init() performs the load.
            load_pending = true;
            LOG_DEBUG << "Host ready before store connection. Load deferred. Store state: " << state_name(state);
        }
    }

    void bridge::release_host()
    {
        if (host && host_listener > 0)
            host->remove(host_listener);

        host = NULL;
        host_listener = 0;
        load_pending = false;
    }

    /**
     * Reads the persisted tree and swaps it into the root. The root instance stays the
     * same so references to it remain valid. The tree is left untouched on any failure.
     * @return 0 on success (including when nothing was persisted yet). -1 on error.
     */
    int bridge::load()
    {
        if (state != BRIDGE_STATE::CONNECTED)
        {
            LOG_ERROR << "Cannot load filesystem. Store state: " << state_name(state);
            return -1;
        }

        const store::get_result res = store.get(FS_COLLECTION, FS_RECORD_KEY).get();
        if (res.status == -1)
        {
            LOG_ERROR << "Failed to load filesystem from store.";
            return -1;
        }

        if (res.value.has_value())
        {
            std::unique_ptr<fs::directory> loaded;
            if (codec::decode(loaded, res.value->data(), res.value->size()) == -1)
            {
                LOG_ERROR << "Failed to load filesystem from store. Invalid record.";
                return -1;
            }

            if (loaded->get_name() != root.get_name())
                LOG_WARNING << "Persisted root name '" << loaded->get_name() << "' differs from '" << root.get_name() << "'.";

            root.take_entries(*loaded);
        }

        state = BRIDGE_STATE::LOADED;
        LOG_INFO << "Filesystem loaded from store. entries:" << root.count() << " size:" << root.size();
        return 0;
    }

    /**
     * Writes the whole tree to the store as a single record.
     * Saving before load() completes overwrites any previously persisted tree.
     * @return 0 when the write transaction completed. -1 on error.
     */
    int bridge::save()
    {
        if (state != BRIDGE_STATE::CONNECTED && state != BRIDGE_STATE::LOADED)
        {
            LOG_ERROR << "Cannot save filesystem. Store state: " << state_name(state);
            return -1;
        }

        std::vector<uint8_t> record;
        if (codec::encode(record, root) == -1)
        {
            LOG_ERROR << "Filesystem encode failed.";
            return -1;
        }

        const size_t record_size = record.size();
        if (store.put(FS_COLLECTION, FS_RECORD_KEY, std::move(record)).get() == -1)
        {
            LOG_ERROR << "Filesystem save failed.";
            return -1;
        }

        LOG_INFO << "Filesystem saved. record size:" << record_size;
        return 0;
    }

    /**
     * Detaches from the host and closes the store. The in-memory tree is kept.
     */
    void bridge::shutdown()
    {
        release_host();

        if (state != BRIDGE_STATE::UNINITIALIZED)
        {
            store.close();
            state = BRIDGE_STATE::UNINITIALIZED;
            LOG_DEBUG << "Bridge shutdown complete.";
        }
    }

    fs::directory &bridge::get_root()
    {
        return root;
    }

    BRIDGE_STATE bridge::get_state() const
    {
        return state;
    }

    bridge::~bridge()
    {
        shutdown();
    }

    const char *state_name(const BRIDGE_STATE state)
    {
        switch (state)
        {
        case BRIDGE_STATE::UNINITIALIZED:
            return "uninitialized";
        case BRIDGE_STATE::CONNECTED:
            return "connected";
        case BRIDGE_STATE::DEGRADED:
            return "degraded";
        case BRIDGE_STATE::LOADED:
            return "loaded";
        default:
            return "unknown";
        }
    }

} // namespace treefs::persist
