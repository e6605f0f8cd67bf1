/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

namespace mdfkit {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    if (logger_ != nullptr) {
        return;
    }
    // Another component may already have registered a logger with this name
    logger_ = spdlog::get(name);
    if (logger_ == nullptr) {
        logger_ = spdlog::stderr_color_mt(name);
    }
    logger_->set_level(level);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (logger_ == nullptr) {
        init();
    }
    return logger_;
}

void Logger::set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

bool Logger::parse_level(const std::string& name,
                         spdlog::level::level_enum* level) {
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    *level = parsed;
    return true;
}

void Logger::shutdown() {
    if (logger_ != nullptr) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

}  // namespace mdfkit
