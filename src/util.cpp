#include <sys/stat.h>
#include <fcntl.h>
#include <ftw.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <string>
#include <chrono>
#include <signal.h>
#include <libgen.h>
#include <stdlib.h>
#include "util.hpp"
#include "tracelog.hpp"

namespace util
{
    // Unicode replacement character emitted for invalid code units.
    constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

    /**
     * Returns current time in UNIX epoch milliseconds.
     */
    int64_t epoch()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    bool is_dir_exists(std::string_view path)
    {
        struct stat st;
        return (stat(std::string(path).c_str(), &st) == 0 && S_ISDIR(st.st_mode));
    }

    bool is_file_exists(std::string_view path)
    {
        struct stat st;
        return (stat(std::string(path).c_str(), &st) == 0 && S_ISREG(st.st_mode));
    }

    // Applies signal mask to the calling thread.
    void mask_signal()
    {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &mask, NULL);
    }

    // Returns the parent full path of the given path.
    const std::string get_parent_path(std::string_view path)
    {
        char *path2 = strndup(path.data(), path.size());
        const std::string parent_path = dirname(path2);
        free(path2);
        return parent_path;
    }

    /**
     * Recursively creates directories and sub-directories if not exist.
     * @param path Directory path.
     * @return Returns 0 operations succeeded otherwise -1.
     */
    int create_dir_tree_recursive(std::string_view path)
    {
        if (path == "/" || path == ".") // No need of checking if we are at root.
            return 0;

        const std::string dir_path(path);

        // Check whether this dir exists or not.
        struct stat st;
        if (stat(dir_path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
        {
            // Check and create parent dir tree first.
            if (create_dir_tree_recursive(util::get_parent_path(dir_path)) == -1)
                return -1;

            // Create this dir.
            if (mkdir(dir_path.c_str(), S_IRWXU | S_IRWXG | S_IROTH) == -1)
            {
                if (errno != EEXIST)
                    return -1;

                // Created concurrently by someone else, or taken by a non directory.
                if (!is_dir_exists(dir_path))
                {
                    errno = ENOTDIR;
                    return -1;
                }
            }
        }

        return 0;
    }

    static int remove_entry(const char *fpath, const struct stat *sb, int typeflag, struct FTW *ftwbuf)
    {
        return remove(fpath);
    }

    /**
     * Removes the given directory along with all its contents.
     * @param dir_path Directory path.
     * @return Returns 0 on success and -1 on error.
     */
    int remove_directory_recursively(std::string_view dir_path)
    {
        const std::string path(dir_path);
        if (!is_dir_exists(path))
            return 0;

        if (nftw(path.c_str(), remove_entry, 64, FTW_DEPTH | FTW_PHYS) == -1)
        {
            LOG_ERROR << errno << ": Error when removing directory " << path;
            return -1;
        }

        return 0;
    }

    /**
     * Convert the given uint16_t number to bytes in big endian format.
     * @param dest Byte array pointer.
     * @param x Number to be converted.
    */
    void uint16_to_bytes(uint8_t *dest, const uint16_t x)
    {
        dest[0] = (uint8_t)((x >> 8) & 0xff);
        dest[1] = (uint8_t)((x >> 0) & 0xff);
    }

    /**
     * Read the uint16_t number from the given byte array which is in big endian format.
     * @param data Byte array pointer.
     * @return The uint16_t number in the given byte array.
    */
    uint16_t uint16_from_bytes(const uint8_t *data)
    {
        return ((uint16_t)data[0] << 8) +
               (uint16_t)data[1];
    }

    void uint32_to_bytes(uint8_t *dest, const uint32_t x)
    {
        dest[0] = (uint8_t)((x >> 24) & 0xff);
        dest[1] = (uint8_t)((x >> 16) & 0xff);
        dest[2] = (uint8_t)((x >> 8) & 0xff);
        dest[3] = (uint8_t)((x >> 0) & 0xff);
    }

    uint32_t uint32_from_bytes(const uint8_t *data)
    {
        return ((uint32_t)data[0] << 24) +
               ((uint32_t)data[1] << 16) +
               ((uint32_t)data[2] << 8) +
               ((uint32_t)data[3]);
    }

    void uint64_to_bytes(uint8_t *dest, const uint64_t x)
    {
        dest[0] = (uint8_t)((x >> 56) & 0xff);
        dest[1] = (uint8_t)((x >> 48) & 0xff);
        dest[2] = (uint8_t)((x >> 40) & 0xff);
        dest[3] = (uint8_t)((x >> 32) & 0xff);
        dest[4] = (uint8_t)((x >> 24) & 0xff);
        dest[5] = (uint8_t)((x >> 16) & 0xff);
        dest[6] = (uint8_t)((x >> 8) & 0xff);
        dest[7] = (uint8_t)((x >> 0) & 0xff);
    }

    uint64_t uint64_from_bytes(const uint8_t *data)
    {
        return ((uint64_t)data[0] << 56) +
               ((uint64_t)data[1] << 48) +
               ((uint64_t)data[2] << 40) +
               ((uint64_t)data[3] << 32) +
               ((uint64_t)data[4] << 24) +
               ((uint64_t)data[5] << 16) +
               ((uint64_t)data[6] << 8) +
               ((uint64_t)data[7]);
    }

    /**
     * Appends the UTF-8 byte sequence of the given code point. Surrogates and values
     * beyond U+10FFFF are written as the replacement character.
     */
    void append_utf8(std::vector<uint8_t> &dest, const uint32_t code_point)
    {
        uint32_t cp = code_point;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            cp = REPLACEMENT_CHAR;

        if (cp < 0x80)
        {
            dest.push_back((uint8_t)cp);
        }
        else if (cp < 0x800)
        {
            dest.push_back((uint8_t)(0xC0 | (cp >> 6)));
            dest.push_back((uint8_t)(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            dest.push_back((uint8_t)(0xE0 | (cp >> 12)));
            dest.push_back((uint8_t)(0x80 | ((cp >> 6) & 0x3F)));
            dest.push_back((uint8_t)(0x80 | (cp & 0x3F)));
        }
        else
        {
            dest.push_back((uint8_t)(0xF0 | (cp >> 18)));
            dest.push_back((uint8_t)(0x80 | ((cp >> 12) & 0x3F)));
            dest.push_back((uint8_t)(0x80 | ((cp >> 6) & 0x3F)));
            dest.push_back((uint8_t)(0x80 | (cp & 0x3F)));
        }
    }

    /**
     * Converts UTF-16 text to UTF-8 bytes. Unpaired surrogates become U+FFFD.
     */
    const std::vector<uint8_t> utf16_to_utf8(std::u16string_view text)
    {
        std::vector<uint8_t> bytes;
        bytes.reserve(text.size());

        for (size_t i = 0; i < text.size(); i++)
        {
            const uint32_t unit = text[i];
            if (unit >= 0xD800 && unit <= 0xDBFF && (i + 1) < text.size() &&
                text[i + 1] >= 0xDC00 && text[i + 1] <= 0xDFFF)
            {
                const uint32_t low = text[++i];
                append_utf8(bytes, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            }
            else
            {
                // A lone surrogate is mapped to the replacement char by append_utf8.
                append_utf8(bytes, unit);
            }
        }

        return bytes;
    }

    const std::vector<uint8_t> utf32_to_utf8(std::u32string_view text)
    {
        std::vector<uint8_t> bytes;
        bytes.reserve(text.size());

        for (const char32_t cp : text)
            append_utf8(bytes, cp);

        return bytes;
    }

} // namespace util
