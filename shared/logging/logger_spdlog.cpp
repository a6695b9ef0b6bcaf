#include "logger_spdlog.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <fmt/core.h>


namespace logging {


SpdlogBackend::~SpdlogBackend() {
    if (initialized_) shutdown();
}

Result<void> SpdlogBackend::init() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    spdlog::set_pattern("[%n] [%^%l%$] %v");
    initialized_ = true;
    return OK();
}

Result<void> SpdlogBackend::shutdown() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!initialized_) return OK();
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
    spdlog::drop_all();
    tag_sinks_.clear();
    initialized_ = false;
    return OK();
}

std::shared_ptr<spdlog::logger> SpdlogBackend::registerLocked_(const std::string& tag) {
    auto existing = spdlog::get(tag);
    if (existing) return existing;

    std::vector<spdlog::sink_ptr> sinks;
    auto own = tag_sinks_.find(tag);
    if (own != tag_sinks_.end()) sinks = own->second;

    // attach global sink
    auto global = tag_sinks_.find(std::string(GLOBAL_TAG));
    if (global != tag_sinks_.end()) {
        for (auto& g_sink : global->second) sinks.push_back(g_sink);
    }

    // 설정된 sink가 하나도 없으면 기본 콘솔
    if (sinks.empty()) sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end());
    auto level = tag_levels_.find(tag);
    logger->set_level(toSpd_(level != tag_levels_.end() ? level->second : global_level_));
    spdlog::register_logger(logger);
    return logger;
}

Result<void> SpdlogBackend::registerLogger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!initialized_) return Error(ResultCode::InvalidState, "spdlog backend is not initialized");
    try {
        registerLocked_(tag);
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InternalError, fmt::format("register logger {}: {}", tag, e.what()));
    }
    return OK();
}

Result<void> SpdlogBackend::setLevel(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (tag == GLOBAL_TAG) {
        global_level_ = level;
        return OK();
    }
    tag_levels_[tag] = level;
    auto logger = spdlog::get(tag);
    if (logger) {
        logger->set_level(toSpd_(level));
    }
    return OK();
}

Result<void> SpdlogBackend::setConsoleSink(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    return OK();
}

Result<void> SpdlogBackend::setFileSink(const std::string& tag, const std::string& filename) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("file sink {}: {}", filename, e.what()));
    }
    return OK();
}

Result<void> SpdlogBackend::setRotatingFileSink(const std::string& tag, const std::string& filename, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        tag_sinks_[tag].push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_size, max_files));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("rotating file sink {}: {}", filename, e.what()));
    }
    return OK();
}

void SpdlogBackend::log(const std::string& tag, Level level, const std::string& msg) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (!initialized_ || disabled_tags_.count(tag)) return;
        try {
            logger = registerLocked_(tag);
        } catch (const spdlog::spdlog_ex& e) {
            // spdlog 기본 error handler 와 동일하게 stderr 로 보고
            fmt::print(stderr, "[*** LOG ERROR ***] [{}] {}\n", tag, e.what());
            return;
        }
    }

    logger->log(toSpd_(level), msg);
    if (level == Level::Fatal) {
        spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
    }
}

void SpdlogBackend::flush() {
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> l){ l->flush(); });
}


} // namespace logging
