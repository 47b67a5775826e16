#ifndef _TREEFS_FS_DIRECTORY_
#define _TREEFS_FS_DIRECTORY_

#include <list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "entry.hpp"
#include "file.hpp"

namespace treefs::fs
{
    /**
     * Composite entry owning a name-keyed collection of child entries.
     * Children are kept in insertion order. Lookups and mutations never throw;
     * missing names and name collisions are reported with nullptr/false.
     */
    class directory : public entry
    {
    private:
        struct child
        {
            std::string key;
            std::unique_ptr<entry> ent;
        };
        typedef std::list<child> child_list;

        child_list children;                                         // Insertion ordered children.
        std::unordered_map<std::string, child_list::iterator> index; // Children keyed by name.

        bool is_self_or_ancestor(const entry *e) const;
        const entry *find(std::string_view name, const std::optional<ENTRY_KIND> kind) const;

    public:
        directory(std::string_view name, std::vector<std::unique_ptr<entry>> entries = {});

        bool add_entry(std::unique_ptr<entry> &&e);
        bool add_entry(std::unique_ptr<entry> &&e, std::string_view name);
        std::unique_ptr<entry> set_entry(std::unique_ptr<entry> &&e);
        std::unique_ptr<entry> set_entry(std::unique_ptr<entry> &&e, std::string_view name);
        entry *get_entry(std::string_view name, const std::optional<ENTRY_KIND> kind = std::nullopt);
        const entry *get_entry(std::string_view name, const std::optional<ENTRY_KIND> kind = std::nullopt) const;
        file *get_file(std::string_view name);
        directory *get_dir(std::string_view name);
        bool has_entry(std::string_view name, const std::optional<ENTRY_KIND> kind = std::nullopt) const;
        bool delete_entry(std::string_view name, const std::optional<ENTRY_KIND> kind = std::nullopt);
        const std::vector<entry *> get_entries(const std::optional<ENTRY_KIND> kind = std::nullopt) const;
        const std::vector<std::string> get_entry_names(const std::optional<ENTRY_KIND> kind = std::nullopt) const;
        const std::vector<file *> get_files(const bool recursive = true) const;
        bool clear(const std::optional<ENTRY_KIND> kind = std::nullopt);
        void take_entries(directory &other);
        size_t count() const;
        size_t size() const override;
    };

} // namespace treefs::fs

#endif
