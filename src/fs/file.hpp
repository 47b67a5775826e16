#ifndef _TREEFS_FS_FILE_
#define _TREEFS_FS_FILE_

#include <string_view>
#include <vector>
#include "entry.hpp"
#include "../hasher.hpp"

namespace treefs::fs
{
    /**
     * Leaf entry holding an immutable byte payload. Text payloads are stored as
     * their UTF-8 bytes; the original text encoding is not retained.
     */
    class file : public entry
    {
    private:
        const std::vector<uint8_t> content;

    public:
        file(std::string_view name, std::vector<uint8_t> content);
        file(std::string_view name, const uint8_t *buf, const size_t len);
        file(std::string_view name, std::string_view text);
        file(std::string_view name, std::u16string_view text);
        file(std::string_view name, std::u32string_view text);

        const std::vector<uint8_t> &get_content() const;
        std::string_view get_text() const;
        const hasher::h32 get_content_hash() const;
        size_t size() const override;
    };

} // namespace treefs::fs

#endif
