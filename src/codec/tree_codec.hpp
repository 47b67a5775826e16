#ifndef _TREEFS_CODEC_TREE_CODEC_
#define _TREEFS_CODEC_TREE_CODEC_

#include <memory>
#include <vector>
#include <stdint.h>
#include "../fs/directory.hpp"
#include "../hasher.hpp"
#include "../version.hpp"

namespace treefs::codec
{
    constexpr const char *RECORD_MAGIC = "TRFS";
    constexpr size_t RECORD_MAGIC_LEN = 4;
    constexpr uint16_t RECORD_FORMAT_VERSION = 1;

    // Max directory nesting accepted when decoding.
    constexpr uint32_t MAX_DECODE_DEPTH = 1024;

    /**
     * Persisted record header. All integers are big endian.
     * [version bytes (8)][magic (4)][format version (2)][blake3 body hash (32)]
     */
    constexpr size_t RECORD_HEADER_LEN = version::VERSION_BYTES_LEN + RECORD_MAGIC_LEN + 2 + sizeof(hasher::h32);

    struct record_info
    {
        std::string treefs_version; // treefs version that wrote the record.
        uint16_t format_version = 0;
        hasher::h32 body_hash = hasher::h32_empty;
        size_t body_len = 0;
    };

    int encode(std::vector<uint8_t> &buf, const fs::directory &root);
    int decode(std::unique_ptr<fs::directory> &root, const uint8_t *data, const size_t len);
    int read_header(record_info &info, const uint8_t *data, const size_t len);

} // namespace treefs::codec

#endif
