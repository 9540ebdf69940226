// tests/log/test_logger.cpp
#define BOOST_TEST_MODULE LoggerTests
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/trivial.hpp>
#include <boost/make_shared.hpp>
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

#include "weave/di/di.hpp"
#include "weave/log/logger.hpp"

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

using weave::log::LogConfig;
using weave::log::Logger;

using TestSink = sinks::synchronous_sink<sinks::text_ostream_backend>;

// Routes every record into a stringstream as "<severity>: <message>"
struct LogFixture {
    LogFixture() {
        auto backend = boost::make_shared<sinks::text_ostream_backend>();
        backend->add_stream(
            boost::shared_ptr<std::ostream>(&stream, boost::null_deleter()));
        backend->auto_flush(true);

        sink = boost::make_shared<TestSink>(backend);
        sink->set_formatter(
            expr::stream
            << expr::attr<logging::trivial::severity_level>("Severity")
            << ": " << expr::smessage);
        logging::core::get()->add_sink(sink);
        Logger::set_level(LogConfig::LogLevel::TRACE);
    }

    ~LogFixture() {
        logging::core::get()->remove_sink(sink);
        Logger::set_level(LogConfig::LogLevel::INFO);
    }

    bool logged(const std::string& text) const {
        return stream.str().find(text) != std::string::npos;
    }

    std::stringstream stream;
    boost::shared_ptr<TestSink> sink;
};

BOOST_FIXTURE_TEST_SUITE(LoggerTestSuite, LogFixture)

BOOST_AUTO_TEST_CASE(test_log_macros) {
    WEAVE_LOG_INFO << "This is an info message.";
    WEAVE_LOG_DEBUG << "This is a debug message.";

    BOOST_CHECK(logged("info: This is an info message."));
    BOOST_CHECK(logged("debug: This is a debug message."));
}

BOOST_AUTO_TEST_CASE(test_log_level_filtering) {
    Logger::set_level(LogConfig::LogLevel::WARN);

    WEAVE_LOG_INFO << "This info message should not appear.";
    WEAVE_LOG_WARN << "This warning message should appear.";
    WEAVE_LOG_ERROR << "This error message should also appear.";

    BOOST_CHECK(!logged("This info message should not appear."));
    BOOST_CHECK(logged("warning: This warning message should appear."));
    BOOST_CHECK(logged("error: This error message should also appear."));
}

BOOST_AUTO_TEST_CASE(test_level_from_string) {
    BOOST_CHECK(Logger::level_from_string("TRACE") ==
                LogConfig::LogLevel::TRACE);
    BOOST_CHECK(Logger::level_from_string("warning") ==
                LogConfig::LogLevel::WARN);
    BOOST_CHECK(Logger::level_from_string("critical") ==
                LogConfig::LogLevel::FATAL);
    BOOST_CHECK_THROW(Logger::level_from_string("verbose"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(Logger::level_from_string("d\xC3\xA9" "bug"),
                      std::invalid_argument);
    BOOST_CHECK_EQUAL(LogConfig::level_to_string(LogConfig::LogLevel::ERROR),
                      "error");
}

BOOST_AUTO_TEST_CASE(test_invalid_file_config_rejected) {
    LogConfig config;
    config.console.enabled = false;
    config.file.enabled = true;
    config.file.log_file = "";

    BOOST_CHECK_THROW(Logger::init(config), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_container_traces_construction) {
    using namespace weave::di;

    auto provider = create_provider([](ServiceRegistryBuilder& builder) {
        builder.add_scoped<std::string>(
            "greeting", [] { return std::make_shared<std::string>("hi"); });
    });
    auto scope = provider->begin_scope();
    scope->set_name("request");
    auto context = scope->create_context();
    context.resolve("greeting");

    BOOST_CHECK(logged("trace: /request/ Creating scoped service 'greeting'"));
}

BOOST_AUTO_TEST_CASE(test_container_logs_resolve_errors) {
    using namespace weave::di;

    auto provider = create_provider([](ServiceRegistryBuilder& builder) {
        builder.add_transient<std::string>(
            "loop", [](DependencyContext& context) {
                return context.get<std::string>("loop");
            });
    });
    auto context = provider->begin();

    BOOST_CHECK_THROW(context.resolve("loop"), ResolveError);
    BOOST_CHECK(logged(
        "debug: /(unnamed)/ Invalid service resolution: [loop] -> [loop]"));
}

BOOST_AUTO_TEST_SUITE_END()
