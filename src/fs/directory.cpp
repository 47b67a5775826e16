#include "directory.hpp"
#include "../tracelog.hpp"

namespace treefs::fs
{
    /**
     * @param name Directory name.
     * @param entries Initial children. Each one is inserted like add_entry() so children
     *                with colliding names are dropped.
     */
    directory::directory(std::string_view name, std::vector<std::unique_ptr<entry>> entries) : entry(name, ENTRY_KIND::DIR)
    {
        for (std::unique_ptr<entry> &e : entries)
        {
            if (e && !add_entry(std::move(e)))
                LOG_DEBUG << "Dropped initial entry with duplicate name '" << e->get_name() << "' in " << name;
        }
    }

    /**
     * Returns true if the given entry is this directory or one of its ancestors.
     * Inserting such an entry would make the parent chain cyclic.
     */
    bool directory::is_self_or_ancestor(const entry *e) const
    {
        for (const entry *d = this; d != NULL; d = d->parent)
        {
            if (d == e)
                return true;
        }
        return false;
    }

    const entry *directory::find(std::string_view name, const std::optional<ENTRY_KIND> kind) const
    {
        const auto itr = index.find(std::string(name));
        if (itr == index.end())
            return NULL;

        const entry *e = itr->second->ent.get();
        return e->is(kind) ? e : NULL;
    }

    bool directory::add_entry(std::unique_ptr<entry> &&e)
    {
        if (!e)
            return false;

        const std::string name = e->get_name();
        return add_entry(std::move(e), name);
    }

    /**
     * Inserts the entry under the given name only if the name is free.
     * @return true if inserted. false if the name is taken or the entry cannot be placed here.
     *         The caller keeps ownership of the entry when false is returned.
     */
    bool directory::add_entry(std::unique_ptr<entry> &&e, std::string_view name)
    {
        if (!e || is_self_or_ancestor(e.get()))
            return false;

        std::string key(name);
        if (index.count(key) == 1)
            return false;

        e->parent = this;
        children.push_back(child{key, std::move(e)});
        index.emplace(std::move(key), std::prev(children.end()));
        return true;
    }

    std::unique_ptr<entry> directory::set_entry(std::unique_ptr<entry> &&e)
    {
        if (!e)
            return nullptr;

        const std::string name = e->get_name();
        return set_entry(std::move(e), name);
    }

    /**
     * Inserts or replaces the entry under the given name. A replaced entry keeps the
     * original insertion position of the name.
     * @return The previous entry under the name (detached from this directory), or nullptr.
     */
    std::unique_ptr<entry> directory::set_entry(std::unique_ptr<entry> &&e, std::string_view name)
    {
        if (!e || is_self_or_ancestor(e.get()))
            return nullptr;

        std::string key(name);
        const auto itr = index.find(key);
        if (itr == index.end())
        {
            e->parent = this;
            children.push_back(child{key, std::move(e)});
            index.emplace(std::move(key), std::prev(children.end()));
            return nullptr;
        }

        std::unique_ptr<entry> previous = std::move(itr->second->ent);
        previous->parent = NULL;
        e->parent = this;
        itr->second->ent = std::move(e);
        return previous;
    }

    entry *directory::get_entry(std::string_view name, const std::optional<ENTRY_KIND> kind)
    {
        return const_cast<entry *>(find(name, kind));
    }

    const entry *directory::get_entry(std::string_view name, const std::optional<ENTRY_KIND> kind) const
    {
        return find(name, kind);
    }

    file *directory::get_file(std::string_view name)
    {
        return static_cast<file *>(get_entry(name, ENTRY_KIND::FILE));
    }

    directory *directory::get_dir(std::string_view name)
    {
        return static_cast<directory *>(get_entry(name, ENTRY_KIND::DIR));
    }

    bool directory::has_entry(std::string_view name, const std::optional<ENTRY_KIND> kind) const
    {
        return find(name, kind) != NULL;
    }

    bool directory::delete_entry(std::string_view name, const std::optional<ENTRY_KIND> kind)
    {
        const auto itr = index.find(std::string(name));
        if (itr == index.end() || !itr->second->ent->is(kind))
            return false;

        children.erase(itr->second);
        index.erase(itr);
        return true;
    }

    const std::vector<entry *> directory::get_entries(const std::optional<ENTRY_KIND> kind) const
    {
        std::vector<entry *> list;
        for (const child &c : children)
        {
            if (c.ent->is(kind))
                list.push_back(c.ent.get());
        }
        return list;
    }

    const std::vector<std::string> directory::get_entry_names(const std::optional<ENTRY_KIND> kind) const
    {
        std::vector<std::string> names;
        for (const child &c : children)
        {
            if (c.ent->is(kind))
                names.push_back(c.key);
        }
        return names;
    }

    /**
     * Collects file entries. Direct files come first (in insertion order) followed by
     * the files of each sub directory, depth first, in insertion order.
     * @param recursive Whether to descend into sub directories.
     */
    const std::vector<file *> directory::get_files(const bool recursive) const
    {
        std::vector<file *> files;
        for (entry *e : get_entries(ENTRY_KIND::FILE))
            files.push_back(static_cast<file *>(e));

        if (!recursive)
            return files;

        for (entry *e : get_entries(ENTRY_KIND::DIR))
        {
            const std::vector<file *> sub_files = static_cast<directory *>(e)->get_files(true);
            files.insert(files.end(), sub_files.begin(), sub_files.end());
        }

        return files;
    }

    /**
     * Removes all children, or only the children of the given kind.
     * @return true if any child was removed.
     */
    bool directory::clear(const std::optional<ENTRY_KIND> kind)
    {
        if (children.empty())
            return false;

        const size_t prev_count = children.size();
        if (!kind.has_value())
        {
            index.clear();
            children.clear();
        }
        else
        {
            for (const std::string &name : get_entry_names(kind))
                delete_entry(name, kind);
        }

        return prev_count != children.size();
    }

    /**
     * Replaces the children of this directory with the children of the other directory.
     * The other directory is left empty. Used to swap a freshly built tree into a live
     * directory while keeping the directory instance itself.
     */
    void directory::take_entries(directory &other)
    {
        // Taking over a descendant's children would destroy the descendant itself.
        if (other.is_self_or_ancestor(this))
            return;

        index.clear();
        children.clear();

        children.splice(children.end(), other.children);
        other.index.clear();

        for (auto itr = children.begin(); itr != children.end(); itr++)
        {
            itr->ent->parent = this;
            index.emplace(itr->key, itr);
        }
    }

    size_t directory::count() const
    {
        return children.size();
    }

    size_t directory::size() const
    {
        size_t total = 0;
        for (const child &c : children)
            total += c.ent->size();
        return total;
    }

} // namespace treefs::fs
