#ifndef _TREEFS_VERSION_
#define _TREEFS_VERSION_

#include <string>
#include <string_view>
#include <stdint.h>
#include <stddef.h>

namespace version
{
    // treefs version. Written to every persisted record.
    constexpr const char *TREEFS_VERSION = "1.0.0";

    // Version header size in bytes when serialized in binary format.
    // 2 bytes each for 3 version components. 2 bytes reserved.
    constexpr const size_t VERSION_BYTES_LEN = 8;

    // Binary representations of the versions. (populated during version init)
    extern uint8_t TREEFS_VERSION_BYTES[VERSION_BYTES_LEN];

    int init();

    int set_version_bytes(uint8_t *bytes, std::string_view version);

    const std::string version_from_bytes(const uint8_t *bytes);

}

#endif
