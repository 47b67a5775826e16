#ifndef _TREEFS_TREEFS_
#define _TREEFS_TREEFS_

#include <string>
#include <string_view>
#include <stdint.h>

namespace treefs
{
    enum RUN_MODE
    {
        HELP,    // Nothing to run. Help printed.
        VERSION, // Version printing.
        DUMP,    // Persisted tree printing.
        STAT     // Persisted tree summary printing.
    };

    enum TRACE_LEVEL
    {
        NONE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct treefs_context
    {
        RUN_MODE run_mode = RUN_MODE::HELP;
        TRACE_LEVEL trace_level = TRACE_LEVEL::WARN;
        std::string store_dir;             // Directory of the file based kv store.
        std::string trace_dir;             // Trace log dir. Console only trace if empty.
        uint32_t connect_timeout_ms = 0;   // Store connect timeout.
    };
    extern treefs_context ctx;

    int init(int argc, char **argv);
    int parse_cmd(int argc, char **argv);
    int validate_context();
    int run_dump();
    int run_stat();
    void std_terminate() noexcept;

} // namespace treefs

#endif
