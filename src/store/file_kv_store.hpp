#ifndef _TREEFS_STORE_FILE_KV_STORE_
#define _TREEFS_STORE_FILE_KV_STORE_

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include "kv_store.hpp"

namespace treefs::store
{
    /**
     * kv_store persisted as plain files. Each record lives in
     * <store dir>/<collection>/<key>.rec and is replaced atomically on put.
     */
    class file_kv_store : public kv_store
    {
    private:
        const std::string store_dir;
        std::atomic<bool> opened{false};
        std::vector<std::thread> open_threads; // Open attempts. Joined on close().
        std::mutex write_mutex; // Serializes record writes.

        void open_store();
        int read_record(get_result &result, const std::string &collection, const std::string &key);
        int write_record(const std::string &collection, const std::string &key, const std::vector<uint8_t> &value);
        const std::string get_record_path(const std::string &collection, const std::string &key) const;

    public:
        explicit file_kv_store(std::string_view store_dir);
        void open() override;
        void close() override;
        bool is_open() const override;
        std::future<get_result> get(const std::string &collection, const std::string &key) override;
        std::future<int> put(const std::string &collection, const std::string &key, std::vector<uint8_t> value) override;
        ~file_kv_store();
    };

    bool is_valid_record_name(std::string_view name);

} // namespace treefs::store

#endif
