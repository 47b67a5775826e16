#ifndef _TREEFS_FS_ENTRY_
#define _TREEFS_FS_ENTRY_

#include <string>
#include <string_view>
#include <optional>
#include <ostream>
#include <sys/types.h>
#include <stdint.h>

namespace treefs::fs
{
    // Entry kind. Values are also the kind bytes of the persisted record format.
    enum class ENTRY_KIND : uint8_t
    {
        FILE = 1,
        DIR = 2
    };

    class directory;

    /**
     * A named node of the filesystem tree. Entries are owned by the directory that
     * contains them. The parent pointer is a back-reference maintained by that directory.
     */
    class entry
    {
        friend class directory;

    private:
        const ino_t ino; // Process-unique entry id.
        const std::string name;
        const ENTRY_KIND kind;
        directory *parent = NULL;

    protected:
        entry(std::string_view name, const ENTRY_KIND kind);

    public:
        entry(const entry &) = delete;
        entry &operator=(const entry &) = delete;
        virtual ~entry() = default;

        ino_t get_ino() const;
        const std::string &get_name() const;
        ENTRY_KIND get_kind() const;
        directory *get_parent() const;
        const std::string path() const;
        const char *type_name() const;
        bool is(const std::optional<ENTRY_KIND> kind = std::nullopt) const;
        const std::string to_string() const;
        virtual size_t size() const = 0;
    };

    std::ostream &operator<<(std::ostream &output, const entry &e);

} // namespace treefs::fs

#endif
