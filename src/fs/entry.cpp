#include <string>
#include "entry.hpp"
#include "directory.hpp"
#include "../inodes.hpp"

namespace treefs::fs
{
    entry::entry(std::string_view name, const ENTRY_KIND kind) : ino(inodes::next()),
                                                                  name(name),
                                                                  kind(kind)
    {
    }

    ino_t entry::get_ino() const
    {
        return ino;
    }

    const std::string &entry::get_name() const
    {
        return name;
    }

    ENTRY_KIND entry::get_kind() const
    {
        return kind;
    }

    directory *entry::get_parent() const
    {
        return parent;
    }

    /**
     * Path of this entry. The parent path and the entry name joined with "/",
     * or just the name for an entry without a parent.
     */
    const std::string entry::path() const
    {
        if (!parent)
            return name;

        return std::string(parent->path()).append("/").append(name);
    }

    const char *entry::type_name() const
    {
        switch (kind)
        {
        case ENTRY_KIND::FILE:
            return "file";
        case ENTRY_KIND::DIR:
            return "dir";
        default:
            return "unknown";
        }
    }

    bool entry::is(const std::optional<ENTRY_KIND> kind) const
    {
        return !kind.has_value() || kind.value() == this->kind;
    }

    const std::string entry::to_string() const
    {
        return std::string(type_name()).append(": ").append(path());
    }

    std::ostream &operator<<(std::ostream &output, const entry &e)
    {
        output << e.to_string();
        return output;
    }

} // namespace treefs::fs
