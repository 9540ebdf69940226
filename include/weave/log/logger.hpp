#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "weave/log/log_config.hpp"

namespace weave::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);
};

}  // namespace weave::log

#define WEAVE_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define WEAVE_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define WEAVE_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define WEAVE_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define WEAVE_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define WEAVE_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
