#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace sft {
namespace logger {

namespace {

template <typename Sink>
void set_formatter(Sink& sink) {
    namespace expr = boost::log::expressions;
    sink->set_formatter(
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << boost::log::trivial::severity << "] "
            << expr::smessage
    );
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        if (log_file.empty()) {
            auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);

            using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
            auto sink = boost::make_shared<console_sink>(backend);
            set_formatter(sink);
            boost::log::core::get()->add_sink(sink);
        } else {
            // Create and configure text file sink backend
            auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

            std::filesystem::path log_path = std::filesystem::absolute(log_file);
            backend->set_file_name_pattern(log_path.string());
            backend->set_open_mode(std::ios::out | std::ios::trunc);  // Start with a fresh log
            backend->auto_flush(true);

            using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
            auto sink = boost::make_shared<file_sink>(backend);
            set_formatter(sink);
            boost::log::core::get()->add_sink(sink);
        }

        boost::log::add_common_attributes();
        boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
        boost::log::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                                 << (log_file.empty() ? std::string(" to console") : " to file: " + log_file);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

severity_level parse_severity(const std::string& text) {
    severity_level level;
    if (boost::log::trivial::from_string(text.c_str(), text.size(), level)) {
        return level;
    }
    throw std::invalid_argument("Unknown log level: " + text);
}

} // namespace logger
} // namespace sft
