#include "logging.hpp"

#include <iostream>
#include <mutex>

namespace b64stream {

namespace {

    struct log_state
    {
        std::mutex     mutex_;
        logging::level level_  = logging::level::warning;
        std::ostream   *stream_ = &std::clog;
    };

    log_state& state()
    {
        static log_state state_ {};
        return state_;
    }
}

void logging::set_level(level l)
{
    auto lock = std::unique_lock<std::mutex>(state().mutex_);
    state().level_ = l;
}

logging::level logging::get_level()
{
    auto lock = std::unique_lock<std::mutex>(state().mutex_);
    return state().level_;
}

bool logging::enabled(level l)
{
    return static_cast<int>(l) >= static_cast<int>(get_level());
}

void logging::set_stream(std::ostream& os)
{
    auto lock = std::unique_lock<std::mutex>(state().mutex_);
    state().stream_ = &os;
}

void logging::write(level l, const char *where, std::string const& message)
{
    auto lock = std::unique_lock<std::mutex>(state().mutex_);
    *state().stream_ << '[' << name(l) << "] " << where << " : " << message << std::endl;
}

const char *logging::name(level l)
{
    switch (l) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warning:
            return "warning";
        case level::error:
            return "error";
    }
    return "unknown";
}

bool logging::parse_level(std::string const& text, level& out)
{
    if (text == "debug")
        out = level::debug;
    else if (text == "info")
        out = level::info;
    else if (text == "warning" or text == "warn")
        out = level::warning;
    else if (text == "error")
        out = level::error;
    else
        return false;
    return true;
}

}
