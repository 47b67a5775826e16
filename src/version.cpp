#include <iostream>
#include <string>
#include <string.h>
#include "version.hpp"
#include "util.hpp"

namespace version
{
    // Binary representations of the version. (populated during version init)
    uint8_t TREEFS_VERSION_BYTES[VERSION_BYTES_LEN];

    int init()
    {
        // Generate version bytes.
        if (set_version_bytes(TREEFS_VERSION_BYTES, TREEFS_VERSION) == -1)
            return -1;

        return 0;
    }

    /**
     * Create 8 byte binary version from version string. First 6 bytes contains the 3 version components and the
     * next 2 bytes are reserved for future use.
     * @param bytes Byte buffer to be populated with binary version data.
     * @param version Version string.
     * @return Returns -1 on error and 0 on success.
    */
    int set_version_bytes(uint8_t *bytes, std::string_view version)
    {
        memset(bytes, 0, VERSION_BYTES_LEN);

        const std::string delimeter = ".";
        size_t start = 0;
        size_t end = version.find(delimeter);

        if (end == std::string::npos)
        {
            std::cerr << "Invalid version " << version << std::endl;
            return -1;
        }

        const uint16_t major = atoi(std::string(version.substr(start, end - start)).c_str());

        start = end + delimeter.length();
        end = version.find(delimeter, start);

        if (end == std::string::npos)
        {
            std::cerr << "Invalid version " << version << std::endl;
            return -1;
        }

        const uint16_t minor = atoi(std::string(version.substr(start, end - start)).c_str());
        start = end + delimeter.length();

        const uint16_t patch = atoi(std::string(version.substr(start)).c_str());

        util::uint16_to_bytes(&bytes[0], major);
        util::uint16_to_bytes(&bytes[2], minor);
        util::uint16_to_bytes(&bytes[4], patch);

        return 0;
    }

    // Formats the given binary version as "major.minor.patch".
    const std::string version_from_bytes(const uint8_t *bytes)
    {
        return std::to_string(util::uint16_from_bytes(&bytes[0]))
            .append(".")
            .append(std::to_string(util::uint16_from_bytes(&bytes[2])))
            .append(".")
            .append(std::to_string(util::uint16_from_bytes(&bytes[4])));
    }
}
