#include "file.hpp"
#include "../util.hpp"

namespace treefs::fs
{
    file::file(std::string_view name, std::vector<uint8_t> content) : entry(name, ENTRY_KIND::FILE),
                                                                      content(std::move(content))
    {
    }

    file::file(std::string_view name, const uint8_t *buf, const size_t len) : entry(name, ENTRY_KIND::FILE),
                                                                              content(buf, buf + len)
    {
    }

    // Text is taken as already UTF-8 encoded.
    file::file(std::string_view name, std::string_view text) : entry(name, ENTRY_KIND::FILE),
                                                               content(text.begin(), text.end())
    {
    }

    file::file(std::string_view name, std::u16string_view text) : entry(name, ENTRY_KIND::FILE),
                                                                  content(util::utf16_to_utf8(text))
    {
    }

    file::file(std::string_view name, std::u32string_view text) : entry(name, ENTRY_KIND::FILE),
                                                                  content(util::utf32_to_utf8(text))
    {
    }

    const std::vector<uint8_t> &file::get_content() const
    {
        return content;
    }

    std::string_view file::get_text() const
    {
        return std::string_view(reinterpret_cast<const char *>(content.data()), content.size());
    }

    const hasher::h32 file::get_content_hash() const
    {
        hasher::h32 hash;
        hasher::hash_buf(hash, content.data(), content.size());
        return hash;
    }

    size_t file::size() const
    {
        return content.size();
    }

} // namespace treefs::fs
