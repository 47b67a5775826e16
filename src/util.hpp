#ifndef _TREEFS_UTIL_
#define _TREEFS_UTIL_

#include <string>
#include <string_view>
#include <vector>
#include <stdint.h>

namespace util
{
    int64_t epoch();
    bool is_dir_exists(std::string_view path);
    bool is_file_exists(std::string_view path);
    void mask_signal();
    const std::string get_parent_path(std::string_view path);
    int create_dir_tree_recursive(std::string_view path);
    int remove_directory_recursively(std::string_view dir_path);
    void uint16_to_bytes(uint8_t *dest, const uint16_t x);
    uint16_t uint16_from_bytes(const uint8_t *data);
    void uint32_to_bytes(uint8_t *dest, const uint32_t x);
    uint32_t uint32_from_bytes(const uint8_t *data);
    void uint64_to_bytes(uint8_t *dest, const uint64_t x);
    uint64_t uint64_from_bytes(const uint8_t *data);
    void append_utf8(std::vector<uint8_t> &dest, const uint32_t code_point);
    const std::vector<uint8_t> utf16_to_utf8(std::u16string_view text);
    const std::vector<uint8_t> utf32_to_utf8(std::u32string_view text);

} // namespace util

#endif
