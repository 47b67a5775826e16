#ifndef _TREEFS_STORE_KV_STORE_
#define _TREEFS_STORE_KV_STORE_

#include <future>
#include <optional>
#include <string>
#include <vector>
#include <stdint.h>
#include "../async/signal_target.hpp"

namespace treefs::store
{
    // Signals emitted on the store's signal target when an open() attempt concludes.
    constexpr const char *SIGNAL_OPEN_SUCCESS = "success";
    constexpr const char *SIGNAL_OPEN_ERROR = "error";

    struct get_result
    {
        int status = 0;                             // 0 on success. -1 if the transaction failed.
        std::optional<std::vector<uint8_t>> value; // Empty if there is no record under the key.
    };

    /**
     * Durable key-value store. Records are grouped into named collections and keyed
     * by string. open() is asynchronous and reports its outcome through signals().
     * Each get/put is a separate transaction whose completion is reported through
     * the returned future.
     */
    class kv_store
    {
    protected:
        async::signal_target open_signals;

    public:
        virtual ~kv_store() = default;

        async::signal_target &signals()
        {
            return open_signals;
        }

        virtual void open() = 0;
        virtual void close() = 0;
        virtual bool is_open() const = 0;
        virtual std::future<get_result> get(const std::string &collection, const std::string &key) = 0;
        virtual std::future<int> put(const std::string &collection, const std::string &key, std::vector<uint8_t> value) = 0;
    };

} // namespace treefs::store

#endif
