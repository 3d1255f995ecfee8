// src/utils/logger_sinks/sink.cpp
#include "lgtv_base.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace lgtv::utils
{

const char *Sink::level_to_string(int lvl)
{
    // Matches Logger::Level without including logger.hpp.
    switch (lvl)
    {
    case 0:
        return "TRACE";
    case 1:
        return "DEBUG";
    case 2:
        return "INFO";
    case 3:
        return "WARN";
    case 4:
        return "ERROR";
    case 5:
        return "SYSTEM";
    default:
        return "UNK";
    }
}

std::string Sink::format_logmsg(const LogMessage &msg)
{
    return fmt::format("[LGTV] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n", level_to_string(msg.level),
                       format_tools::formatted_time(msg.timestamp), msg.process_id, msg.thread_id,
                       std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace lgtv::utils
