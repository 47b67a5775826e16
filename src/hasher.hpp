#ifndef _TREEFS_HASHER_
#define _TREEFS_HASHER_

#include <iostream>
#include <string>
#include <string_view>
#include <stdint.h>

namespace treefs::hasher
{
    // blake3 hash is 32 bytes which we store as 4 quad words.
    struct h32
    {
        uint64_t data[4];

        bool operator==(const h32 rhs) const;
        bool operator!=(const h32 rhs) const;
        std::string to_hex() const;
    };
    extern h32 h32_empty;

    // Prints the first 5 bytes in hex.
    std::ostream &operator<<(std::ostream &output, const h32 &h);
    void hash_buf(h32 &hash, std::string_view sv);
    void hash_buf(h32 &hash, const void *buf, const size_t len);

} // namespace treefs::hasher

#endif
