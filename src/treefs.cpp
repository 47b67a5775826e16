#include <iostream>
#include <limits.h>
#include <stdlib.h>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "treefs.hpp"
#include "util.hpp"
#include "tracelog.hpp"
#include "version.hpp"
#include "async/signal_target.hpp"
#include "persist/bridge.hpp"
#include "store/file_kv_store.hpp"

namespace treefs
{
    constexpr const char *TRACE_DIR_NAME = "trace";

    treefs_context ctx;

    int init(int argc, char **argv)
    {
        const int n = 1;
        if (*(char *)&n != 1)
        {
            std::cerr << "Bigendian not supported.\n";
            return -1;
        }

        if (parse_cmd(argc, argv) == -1)
            return -1;

        if (version::init() == -1)
            return -1;

        if (ctx.run_mode == RUN_MODE::HELP)
            return 0;

        if (ctx.run_mode == RUN_MODE::VERSION)
        {
            // Print the version
            std::cout << version::TREEFS_VERSION << std::endl;
            return 0;
        }

        if (validate_context() == -1 || tracelog::init() == -1)
            return -1;

        LOG_INFO << "treefs " << version::TREEFS_VERSION;

        // Register exception handler for std exceptions.
        // This needs to be done after trace log init because we are logging exceptions there.
        std::set_terminate(&std_terminate);

        if (ctx.run_mode == RUN_MODE::DUMP)
            return run_dump();
        else
            return run_stat();
    }

    int validate_context()
    {
        if (!util::is_dir_exists(ctx.store_dir))
        {
            std::cerr << "Directory " << ctx.store_dir << " does not exist.\n";
            return -1;
        }

        if (ctx.trace_dir.empty() && ctx.trace_level != TRACE_LEVEL::NONE)
            ctx.trace_dir.append(ctx.store_dir).append("/").append(TRACE_DIR_NAME);

        return 0;
    }

    int parse_cmd(int argc, char **argv)
    {
        // Initialize CLI.
        CLI::App app("Persistent in-memory tree filesystem");
        app.set_help_all_flag("--help-all", "Expand all help");

        // Initialize subcommands.
        CLI::App *version = app.add_subcommand("version", "treefs version");
        CLI::App *dump = app.add_subcommand("dump", "Print the persisted filesystem tree");
        CLI::App *stat = app.add_subcommand("stat", "Print persisted filesystem summary");

        // Initialize options.
        std::string store_dir, trace_dir, trace_mode;
        uint32_t timeout = persist::DEFAULT_CONNECT_TIMEOUT;

        for (CLI::App *sub : {dump, stat})
        {
            sub->add_option("-d,--store-dir", store_dir, "Store directory")->required()->check(CLI::ExistingDirectory);
            sub->add_option("-t,--trace", trace_mode, "Trace mode")->check(CLI::IsMember({"dbg", "none", "inf", "wrn", "err"}))->default_str("wrn");
            sub->add_option("-r,--trace-dir", trace_dir, "Trace log dir. Default: <store dir>/trace");
            sub->add_option("-w,--timeout", timeout, "Store connect timeout in milliseconds")->default_str("5000");
        }

        CLI11_PARSE(app, argc, argv);

        // Verifying subcommands.
        if (version->parsed())
        {
            ctx.run_mode = RUN_MODE::VERSION;
            return 0;
        }
        else if (dump->parsed() || stat->parsed())
        {
            char buf[PATH_MAX];
            if (realpath(store_dir.c_str(), buf) == NULL)
            {
                std::cerr << errno << ": Invalid store dir " << store_dir << "\n";
                return -1;
            }
            ctx.store_dir = buf;
            ctx.trace_dir = trace_dir;
            ctx.connect_timeout_ms = timeout;

            if (!trace_mode.empty())
            {
                if (trace_mode == "dbg")
                    ctx.trace_level = TRACE_LEVEL::DEBUG;
                else if (trace_mode == "none")
                    ctx.trace_level = TRACE_LEVEL::NONE;
                else if (trace_mode == "inf")
                    ctx.trace_level = TRACE_LEVEL::INFO;
                else if (trace_mode == "wrn")
                    ctx.trace_level = TRACE_LEVEL::WARN;
                else if (trace_mode == "err")
                    ctx.trace_level = TRACE_LEVEL::ERROR;
                else
                    return -1;
            }

            ctx.run_mode = dump->parsed() ? RUN_MODE::DUMP : RUN_MODE::STAT;
            return 0;
        }

        ctx.run_mode = RUN_MODE::HELP;
        std::cout << app.help();
        return 0;
    }

    /**
     * Connects the bridge and loads the persisted tree through the host ready signal.
     * @return 0 if the tree was loaded. -1 on error.
     */
    int open_tree(persist::bridge &fs_bridge)
    {
        if (fs_bridge.init() == -1)
        {
            std::cerr << "Store at " << ctx.store_dir << " is unavailable.\n";
            return -1;
        }

        async::signal_target host;
        fs_bridge.attach_host(host);
        host.emit(persist::HOST_READY_SIGNAL);

        if (fs_bridge.get_state() != persist::BRIDGE_STATE::LOADED)
        {
            std::cerr << "Failed to load filesystem from " << ctx.store_dir << "\n";
            fs_bridge.shutdown();
            return -1;
        }

        return 0;
    }

    void print_tree(const fs::directory &dir, const int depth)
    {
        for (const fs::entry *e : dir.get_entries())
        {
            std::cout << std::string(depth * 2, ' ') << *e << " (" << e->size() << " bytes)\n";
            if (e->is(fs::ENTRY_KIND::DIR))
                print_tree(*static_cast<const fs::directory *>(e), depth + 1);
        }
    }

    int run_dump()
    {
        store::file_kv_store kv(ctx.store_dir);
        persist::bridge fs_bridge(kv, ctx.connect_timeout_ms);
        if (open_tree(fs_bridge) == -1)
            return -1;

        const fs::directory &root = fs_bridge.get_root();
        std::cout << root << " (" << root.size() << " bytes)\n";
        print_tree(root, 1);

        fs_bridge.shutdown();
        return 0;
    }

    int run_stat()
    {
        store::file_kv_store kv(ctx.store_dir);
        persist::bridge fs_bridge(kv, ctx.connect_timeout_ms);
        if (open_tree(fs_bridge) == -1)
            return -1;

        const fs::directory &root = fs_bridge.get_root();
        const std::vector<fs::file *> files = root.get_files(true);

        for (const fs::file *f : files)
            std::cout << f->get_content_hash() << " " << f->size() << " " << f->path() << "\n";

        std::cout << "Top level entries: " << root.count()
                  << " Files: " << files.size()
                  << " Total bytes: " << root.size() << "\n";

        fs_bridge.shutdown();
        return 0;
    }

    /**
     * Global exception handler for std exceptions.
     */
    void std_terminate() noexcept
    {
        std::exception_ptr exptr = std::current_exception();
        if (exptr != 0)
        {
            try
            {
                std::rethrow_exception(exptr);
            }
            catch (std::exception &ex)
            {
                LOG_ERROR << "std error: " << ex.what();
            }
            catch (...)
            {
                LOG_ERROR << "std error: Terminated due to unknown exception.";
            }
        }
        else
        {
            LOG_ERROR << "std error: Terminated due to unknown reason.";
        }

        exit(1);
    }

} // namespace treefs
