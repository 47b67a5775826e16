#include <unistd.h>
#include <errno.h>
#include <iomanip>
#include <iostream>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Initializers/RollingFileInitializer.h>
#include <plog/Appenders/ColorConsoleAppender.h>
#include "treefs.hpp"
#include "util.hpp"
#include "tracelog.hpp"

namespace tracelog
{
    constexpr size_t MAX_TRACE_FILESIZE = 10 * 1024 * 1024; // 10MB
    constexpr size_t MAX_TRACE_FILECOUNT = 10;

    // Trace log category indicators for different treefs run modes.
    constexpr const char *TRACE_DUMP = "][fsd] ";
    constexpr const char *TRACE_STAT = "][fss] ";
    constexpr const char *TRACE_DEFAULT = "][fs] ";
    const char *CURRENT_TRACE_CATEGORY = TRACE_DEFAULT;

    class treefs_plog_formatter;
    static plog::ConsoleAppender<treefs_plog_formatter> consoleAppender;

    // Custom formatter adopted from:
    // https://github.com/SergiusTheBest/plog/blob/master/include/plog/Formatters/TxtFormatter.h
    class treefs_plog_formatter
    {
    public:
        static plog::util::nstring header()
        {
            return plog::util::nstring();
        }

        static inline const char *severity_to_string(plog::Severity severity)
        {
            switch (severity)
            {
            case plog::Severity::fatal:
                return "fat";
            case plog::Severity::error:
                return "err";
            case plog::Severity::warning:
                return "wrn";
            case plog::Severity::info:
                return "inf";
            case plog::Severity::debug:
                return "dbg";
            case plog::Severity::verbose:
                return "ver";
            default:
                return "def";
            }
        }

        static plog::util::nstring format(const plog::Record &record)
        {
            tm t;
            plog::util::localtime_s(&t, &record.getTime().time); // local time

            plog::util::nostringstream ss;
            ss << t.tm_year + 1900 << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_mon + 1 << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_mday << PLOG_NSTR(" ");
            ss << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_hour << PLOG_NSTR(":") << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_min << PLOG_NSTR(":") << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_sec << PLOG_NSTR(" ");
            ss << PLOG_NSTR("[") << severity_to_string(record.getSeverity()) << PLOG_NSTR(CURRENT_TRACE_CATEGORY);
            ss << record.getMessage() << PLOG_NSTR("\n");

            return ss.str();
        }
    };

    int init()
    {
        if (treefs::ctx.trace_level == treefs::TRACE_LEVEL::NONE)
            return 0;

        if (treefs::ctx.run_mode == treefs::RUN_MODE::DUMP)
            CURRENT_TRACE_CATEGORY = TRACE_DUMP;
        else if (treefs::ctx.run_mode == treefs::RUN_MODE::STAT)
            CURRENT_TRACE_CATEGORY = TRACE_STAT;
        else
            CURRENT_TRACE_CATEGORY = TRACE_DEFAULT;

        plog::Severity level;
        if (treefs::ctx.trace_level == treefs::TRACE_LEVEL::DEBUG)
            level = plog::Severity::debug;
        else if (treefs::ctx.trace_level == treefs::TRACE_LEVEL::INFO)
            level = plog::Severity::info;
        else if (treefs::ctx.trace_level == treefs::TRACE_LEVEL::WARN)
            level = plog::Severity::warning;
        else
            level = plog::Severity::error;

        // Without a trace dir we only log to the console.
        if (treefs::ctx.trace_dir.empty())
        {
            plog::init(level, &consoleAppender);
            return 0;
        }

        if (util::create_dir_tree_recursive(treefs::ctx.trace_dir) == -1)
        {
            std::cerr << errno << ": Error creating trace dir " << treefs::ctx.trace_dir << "\n";
            return -1;
        }

        std::string pid_str = std::to_string(getpid());
        std::string trace_file;
        trace_file
            .append(treefs::ctx.trace_dir)
            .append("/")
            .append(std::to_string(treefs::ctx.run_mode))
            .append("_")
            .append(pid_str)
            .append(".log");

        plog::init<treefs_plog_formatter>(level, trace_file.c_str(), MAX_TRACE_FILESIZE, MAX_TRACE_FILECOUNT)
            .addAppender(&consoleAppender);

        return 0;
    }

} // namespace tracelog
