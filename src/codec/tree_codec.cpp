#include <string.h>
#include "tree_codec.hpp"
#include "../util.hpp"
#include "../tracelog.hpp"

/**
 * Whole-tree record format.
 * Header: [version bytes (8)][magic "TRFS" (4)][format version (2)][blake3 hash of body (32)]
 * Body:   one encoded entry (the root directory).
 * Entry:  [kind (1)][name len (4)][name]
 *         file: [content len (8)][content]
 *         dir:  [child count (4)] followed by [key len (4)][key][entry] per child.
 */
namespace treefs::codec
{
    constexpr off_t MAGIC_OFFSET = version::VERSION_BYTES_LEN;
    constexpr off_t FORMAT_OFFSET = MAGIC_OFFSET + RECORD_MAGIC_LEN;
    constexpr off_t HASH_OFFSET = FORMAT_OFFSET + 2;

    /**
     * Bounds checked sequential reader over the record body.
     */
    struct body_reader
    {
        const uint8_t *data;
        size_t len;
        size_t pos = 0;

        bool has(const size_t n) const
        {
            return n <= (len - pos);
        }

        int read_u8(uint8_t &val)
        {
            if (!has(1))
                return -1;
            val = data[pos++];
            return 0;
        }

        int read_u32(uint32_t &val)
        {
            if (!has(4))
                return -1;
            val = util::uint32_from_bytes(&data[pos]);
            pos += 4;
            return 0;
        }

        int read_u64(uint64_t &val)
        {
            if (!has(8))
                return -1;
            val = util::uint64_from_bytes(&data[pos]);
            pos += 8;
            return 0;
        }

        int read_str(std::string &str)
        {
            uint32_t str_len;
            if (read_u32(str_len) == -1 || !has(str_len))
                return -1;
            str.assign(reinterpret_cast<const char *>(&data[pos]), str_len);
            pos += str_len;
            return 0;
        }
    };

    void write_u8(std::vector<uint8_t> &buf, const uint8_t val)
    {
        buf.push_back(val);
    }

    void write_u32(std::vector<uint8_t> &buf, const uint32_t val)
    {
        uint8_t bytes[4];
        util::uint32_to_bytes(bytes, val);
        buf.insert(buf.end(), bytes, bytes + 4);
    }

    void write_u64(std::vector<uint8_t> &buf, const uint64_t val)
    {
        uint8_t bytes[8];
        util::uint64_to_bytes(bytes, val);
        buf.insert(buf.end(), bytes, bytes + 8);
    }

    void write_str(std::vector<uint8_t> &buf, std::string_view str)
    {
        write_u32(buf, str.size());
        buf.insert(buf.end(), str.begin(), str.end());
    }

    void encode_entry(std::vector<uint8_t> &buf, const fs::entry &e)
    {
        write_u8(buf, static_cast<uint8_t>(e.get_kind()));
        write_str(buf, e.get_name());

        if (e.get_kind() == fs::ENTRY_KIND::FILE)
        {
            const std::vector<uint8_t> &content = static_cast<const fs::file &>(e).get_content();
            write_u64(buf, content.size());
            buf.insert(buf.end(), content.begin(), content.end());
        }
        else
        {
            const fs::directory &dir = static_cast<const fs::directory &>(e);
            const std::vector<std::string> keys = dir.get_entry_names();
            write_u32(buf, keys.size());
            for (const std::string &key : keys)
            {
                write_str(buf, key);
                encode_entry(buf, *dir.get_entry(key));
            }
        }
    }

    /**
     * Serializes the given directory and all its descendants into a single record.
     * @param buf Buffer to be populated with the record bytes.
     * @param root Directory to encode.
     * @return 0 on success. -1 on error.
     */
    int encode(std::vector<uint8_t> &buf, const fs::directory &root)
    {
        buf.clear();
        buf.resize(RECORD_HEADER_LEN);

        // Version bytes come from the version string. version::init() may not have run.
        if (version::set_version_bytes(buf.data(), version::TREEFS_VERSION) == -1)
        {
            buf.clear();
            return -1;
        }

        memcpy(buf.data() + MAGIC_OFFSET, RECORD_MAGIC, RECORD_MAGIC_LEN);
        util::uint16_to_bytes(buf.data() + FORMAT_OFFSET, RECORD_FORMAT_VERSION);

        encode_entry(buf, root);

        hasher::h32 body_hash;
        hasher::hash_buf(body_hash, buf.data() + RECORD_HEADER_LEN, buf.size() - RECORD_HEADER_LEN);
        memcpy(buf.data() + HASH_OFFSET, &body_hash, sizeof(hasher::h32));

        LOG_DEBUG << "Encoded tree record. size:" << buf.size() << " hash:" << body_hash;
        return 0;
    }

    int decode_entry(std::unique_ptr<fs::entry> &e, body_reader &reader, const uint32_t depth)
    {
        if (depth > MAX_DECODE_DEPTH)
        {
            LOG_ERROR << "Record nesting exceeds max depth " << MAX_DECODE_DEPTH;
            return -1;
        }

        uint8_t kind;
        std::string name;
        if (reader.read_u8(kind) == -1 || reader.read_str(name) == -1)
        {
            LOG_ERROR << "Truncated entry header at offset " << reader.pos;
            return -1;
        }

        if (kind == static_cast<uint8_t>(fs::ENTRY_KIND::FILE))
        {
            uint64_t content_len;
            if (reader.read_u64(content_len) == -1 || !reader.has(content_len))
            {
                LOG_ERROR << "Truncated file content. " << name;
                return -1;
            }

            e = std::make_unique<fs::file>(name, &reader.data[reader.pos], content_len);
            reader.pos += content_len;
            return 0;
        }
        else if (kind == static_cast<uint8_t>(fs::ENTRY_KIND::DIR))
        {
            uint32_t child_count;
            if (reader.read_u32(child_count) == -1)
            {
                LOG_ERROR << "Truncated dir child count. " << name;
                return -1;
            }

            std::unique_ptr<fs::directory> dir = std::make_unique<fs::directory>(name);
            for (uint32_t i = 0; i < child_count; i++)
            {
                std::string key;
                std::unique_ptr<fs::entry> child;
                if (reader.read_str(key) == -1 || decode_entry(child, reader, depth + 1) == -1)
                {
                    LOG_ERROR << "Error decoding child " << i << " of dir " << name;
                    return -1;
                }

                if (!dir->add_entry(std::move(child), key))
                {
                    LOG_ERROR << "Duplicate entry name '" << key << "' in dir " << name;
                    return -1;
                }
            }

            e = std::move(dir);
            return 0;
        }

        LOG_ERROR << "Invalid entry kind " << (int)kind << " for " << name;
        return -1;
    }

    /**
     * Reads and validates the record header.
     * @return 0 on success. -1 if the header is malformed or the body hash does not match.
     */
    int read_header(record_info &info, const uint8_t *data, const size_t len)
    {
        if (len < RECORD_HEADER_LEN)
        {
            LOG_ERROR << "Record too short. size:" << len;
            return -1;
        }

        if (memcmp(data + MAGIC_OFFSET, RECORD_MAGIC, RECORD_MAGIC_LEN) != 0)
        {
            LOG_ERROR << "Invalid record magic.";
            return -1;
        }

        info.treefs_version = version::version_from_bytes(data);
        info.format_version = util::uint16_from_bytes(data + FORMAT_OFFSET);
        if (info.format_version != RECORD_FORMAT_VERSION)
        {
            LOG_ERROR << "Unsupported record format version " << info.format_version;
            return -1;
        }

        memcpy(&info.body_hash, data + HASH_OFFSET, sizeof(hasher::h32));
        info.body_len = len - RECORD_HEADER_LEN;

        hasher::h32 body_hash;
        hasher::hash_buf(body_hash, data + RECORD_HEADER_LEN, info.body_len);
        if (body_hash != info.body_hash)
        {
            LOG_ERROR << "Record body hash mismatch. expected:" << info.body_hash << " actual:" << body_hash;
            return -1;
        }

        return 0;
    }

    /**
     * Rebuilds a fresh directory tree from a record. Every child is inserted through
     * directory::add_entry so the resulting tree has consistent parent links.
     * @param root Populated with the decoded root directory on success.
     * @return 0 on success. -1 on malformed record.
     */
    int decode(std::unique_ptr<fs::directory> &root, const uint8_t *data, const size_t len)
    {
        record_info info;
        if (read_header(info, data, len) == -1)
            return -1;

        body_reader reader{data + RECORD_HEADER_LEN, info.body_len};
        std::unique_ptr<fs::entry> e;
        if (decode_entry(e, reader, 0) == -1)
            return -1;

        if (e->get_kind() != fs::ENTRY_KIND::DIR)
        {
            LOG_ERROR << "Record root is not a directory.";
            return -1;
        }

        if (reader.pos != reader.len)
        {
            LOG_ERROR << "Trailing bytes after record body. " << (reader.len - reader.pos);
            return -1;
        }

        root.reset(static_cast<fs::directory *>(e.release()));
        LOG_DEBUG << "Decoded tree record written by treefs " << info.treefs_version;
        return 0;
    }

} // namespace treefs::codec
