#include "hasher.hpp"
#include <blake3.h>
#include <string.h>
#include <sstream>
#include <iomanip>

namespace treefs::hasher
{
    /**
     * Helper functions for working with 32 byte hash type h32.
     */

    h32 h32_empty;

    bool h32::operator==(const h32 rhs) const
    {
        return this->data[0] == rhs.data[0] && this->data[1] == rhs.data[1] && this->data[2] == rhs.data[2] && this->data[3] == rhs.data[3];
    }

    bool h32::operator!=(const h32 rhs) const
    {
        return !(*this == rhs);
    }

    std::string h32::to_hex() const
    {
        std::stringstream ss;
        const uint8_t *buf = reinterpret_cast<const uint8_t *>(this);
        for (size_t i = 0; i < sizeof(h32); i++)
            ss << std::hex << std::setfill('0') << std::setw(2) << (int)buf[i];

        return ss.str();
    }

    std::ostream &operator<<(std::ostream &output, const h32 &h)
    {
        const uint8_t *buf = reinterpret_cast<const uint8_t *>(&h);
        for (int i = 0; i < 5; i++) // Only print first 5 bytes in hex.
            output << std::hex << std::setfill('0') << std::setw(2) << (int)buf[i];

        return output << std::dec;
    }

    void hash_buf(h32 &hash, std::string_view sv)
    {
        hash_buf(hash, sv.data(), sv.size());
    }

    void hash_buf(h32 &hash, const void *buf, const size_t len)
    {
        // Initialize the hasher.
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        blake3_hasher_update(&hasher, buf, len);

        blake3_hasher_finalize(&hasher, reinterpret_cast<uint8_t *>(&hash), sizeof(h32));
    }

} // namespace treefs::hasher
