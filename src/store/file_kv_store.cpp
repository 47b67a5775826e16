#include <fcntl.h>
#include <unistd.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include "file_kv_store.hpp"
#include "../util.hpp"
#include "../tracelog.hpp"

namespace treefs::store
{
    constexpr const char *RECORD_FILE_EXT = ".rec";
    constexpr const char *TEMP_FILE_EXT = ".tmp";
    constexpr int FILE_PERMS = 0644;

    /**
     * Collection names and keys become file names, so they must be non-empty and
     * must not contain path separators or refer to the dot entries.
     */
    bool is_valid_record_name(std::string_view name)
    {
        return !name.empty() && name != "." && name != ".." &&
               name.find('/') == std::string_view::npos &&
               name.find('\0') == std::string_view::npos;
    }

    file_kv_store::file_kv_store(std::string_view store_dir) : store_dir(store_dir)
    {
    }

    /**
     * Starts opening the store in the background. The outcome is reported by
     * emitting SIGNAL_OPEN_SUCCESS or SIGNAL_OPEN_ERROR on signals().
     * A previous attempt that is still running is not waited for.
     */
    void file_kv_store::open()
    {
        open_threads.push_back(std::thread(&file_kv_store::open_store, this));
    }

    void file_kv_store::open_store()
    {
        util::mask_signal();

        if (util::create_dir_tree_recursive(store_dir) == -1)
        {
            const std::string err = std::string(strerror(errno));
            LOG_ERROR << errno << ": Error creating store dir " << store_dir;
            open_signals.emit(SIGNAL_OPEN_ERROR, err);
            return;
        }

        if (access(store_dir.c_str(), R_OK | W_OK | X_OK) == -1)
        {
            const std::string err = std::string(strerror(errno));
            LOG_ERROR << errno << ": Store dir not accessible " << store_dir;
            open_signals.emit(SIGNAL_OPEN_ERROR, err);
            return;
        }

        opened = true;
        LOG_INFO << "Store opened at " << store_dir;
        open_signals.emit(SIGNAL_OPEN_SUCCESS, store_dir);
    }

    void file_kv_store::close()
    {
        for (std::thread &t : open_threads)
        {
            if (t.joinable())
                t.join();
        }
        open_threads.clear();

        opened = false;
    }

    bool file_kv_store::is_open() const
    {
        return opened;
    }

    std::future<get_result> file_kv_store::get(const std::string &collection, const std::string &key)
    {
        return std::async(std::launch::async, [this, collection, key]() {
            get_result result;
            result.status = read_record(result, collection, key);
            return result;
        });
    }

    std::future<int> file_kv_store::put(const std::string &collection, const std::string &key, std::vector<uint8_t> value)
    {
        return std::async(std::launch::async, [this, collection, key, value = std::move(value)]() {
            return write_record(collection, key, value);
        });
    }

    const std::string file_kv_store::get_record_path(const std::string &collection, const std::string &key) const
    {
        return std::string(store_dir).append("/").append(collection).append("/").append(key).append(RECORD_FILE_EXT);
    }

    /**
     * Reads the record under the key.
     * @return 0 on success (result.value left empty if no record exists). -1 on error.
     */
    int file_kv_store::read_record(get_result &result, const std::string &collection, const std::string &key)
    {
        if (!opened)
        {
            LOG_ERROR << "Store not open. Cannot read " << collection << "/" << key;
            return -1;
        }

        if (!is_valid_record_name(collection) || !is_valid_record_name(key))
        {
            LOG_ERROR << "Invalid record name " << collection << "/" << key;
            return -1;
        }

        const std::string record_path = get_record_path(collection, key);
        const int fd = ::open(record_path.c_str(), O_RDONLY);
        if (fd == -1)
        {
            if (errno == ENOENT)
                return 0;

            LOG_ERROR << errno << ": Error opening record file " << record_path;
            return -1;
        }

        struct stat st;
        if (fstat(fd, &st) == -1)
        {
            LOG_ERROR << errno << ": Error in stat of record file " << record_path;
            ::close(fd);
            return -1;
        }

        std::vector<uint8_t> value(st.st_size);
        size_t read_len = 0;
        while (read_len < value.size())
        {
            const ssize_t res = pread(fd, value.data() + read_len, value.size() - read_len, read_len);
            if (res <= 0)
            {
                LOG_ERROR << errno << ": Error reading record file " << record_path;
                ::close(fd);
                return -1;
            }
            read_len += res;
        }

        ::close(fd);
        result.value = std::move(value);
        LOG_DEBUG << "Read record " << collection << "/" << key << " size:" << read_len;
        return 0;
    }

    /**
     * Writes the record to a temp file and renames it over the existing record so a
     * reader never observes a partially written record.
     * @return 0 on success. -1 on error.
     */
    int file_kv_store::write_record(const std::string &collection, const std::string &key, const std::vector<uint8_t> &value)
    {
        if (!opened)
        {
            LOG_ERROR << "Store not open. Cannot write " << collection << "/" << key;
            return -1;
        }

        if (!is_valid_record_name(collection) || !is_valid_record_name(key))
        {
            LOG_ERROR << "Invalid record name " << collection << "/" << key;
            return -1;
        }

        std::scoped_lock lock(write_mutex);

        const std::string collection_dir = std::string(store_dir).append("/").append(collection);
        if (util::create_dir_tree_recursive(collection_dir) == -1)
        {
            LOG_ERROR << errno << ": Error creating collection dir " << collection_dir;
            return -1;
        }

        const std::string record_path = get_record_path(collection, key);
        const std::string temp_path = std::string(record_path).append(TEMP_FILE_EXT);

        const int fd = ::open(temp_path.c_str(), O_CREAT | O_TRUNC | O_WRONLY, FILE_PERMS);
        if (fd == -1)
        {
            LOG_ERROR << errno << ": Error creating temp record file " << temp_path;
            return -1;
        }

        size_t written = 0;
        while (written < value.size())
        {
            const ssize_t res = pwrite(fd, value.data() + written, value.size() - written, written);
            if (res == -1)
            {
                LOG_ERROR << errno << ": Error writing temp record file " << temp_path;
                ::close(fd);
                unlink(temp_path.c_str());
                return -1;
            }
            written += res;
        }

        if (fsync(fd) == -1)
        {
            LOG_ERROR << errno << ": Error in fsync of temp record file " << temp_path;
            ::close(fd);
            unlink(temp_path.c_str());
            return -1;
        }
        ::close(fd);

        if (rename(temp_path.c_str(), record_path.c_str()) == -1)
        {
            LOG_ERROR << errno << ": Error replacing record file " << record_path;
            unlink(temp_path.c_str());
            return -1;
        }

        LOG_DEBUG << "Wrote record " << collection << "/" << key << " size:" << value.size();
        return 0;
    }

    file_kv_store::~file_kv_store()
    {
        close();
    }

} // namespace treefs::store
