#pragma once

#include <boost/format.hpp>

#include <iosfwd>
#include <string>
#include <utility>

namespace b64stream {

struct logging
{
    enum class level
    {
        debug,
        info,
        warning,
        error
    };

    static void set_level(level l);

    static level get_level();

    static bool enabled(level l);

    /// Redirect output, std::clog by default. The stream must outlive logging.
    static void set_stream(std::ostream& os);

    static void write(level l, const char *where, std::string const& message);

    static const char *name(level l);

    /// "debug", "info", "warning"/"warn" or "error".
    static bool parse_level(std::string const& text, level& out);
};

/// Apply every argument to a boost::format string, in order.
template<class...Args>
std::string format_message(std::string const& fmt, Args&& ...args)
{
    auto formatter = boost::format(fmt);
    using expand = int[];
    void(expand{
        0,
        ((formatter % std::forward<Args>(args)), 0)...
    });
    return formatter.str();
}

template<class...Args>
void log(logging::level l, const char *where, std::string const& fmt, Args&& ...args)
{
    if (not logging::enabled(l))
        return;
    logging::write(l, where, format_message(fmt, std::forward<Args>(args)...));
}

}

#define B64STREAM_LOG(lvl, ...) \
    ::b64stream::log(::b64stream::logging::level::lvl, __func__, __VA_ARGS__)
