#include "logger.hpp"
#include "logger_spdlog.hpp"
#include <spdlog/details/registry.h>
#include <fmt/core.h>

namespace logging {

bool parseLevel(const std::string& s, Level& level) {
    if (s == "trace") { level = Level::Trace; return true; }
    if (s == "debug") { level = Level::Debug; return true; }
    if (s == "info")  { level = Level::Info;  return true; }
    if (s == "warn")  { level = Level::Warn;  return true; }
    if (s == "error") { level = Level::Error; return true; }
    if (s == "fatal") { level = Level::Fatal; return true; }
    if (s == "off")   { level = Level::Off;   return true; }
    return false;
}

const char* levelName(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Fatal: return "fatal";
        case Level::Off:   return "off";
    }
    return "off";
}

Logger& Logger::instance() {
    // spdlog registry 가 먼저 생성되어야 Logger 보다 늦게 파괴된다.
    spdlog::details::registry::instance();
    static Logger instance;  // C++11 이후 thread-safe 보장
    return instance;
}

Logger::~Logger() {
    if (!logger_) return;
    auto closed = logger_->shutdown();
    if (!closed) fmt::print(stderr, "logger shutdown failed: {}\n", to_string(closed));
}

Result<void> Logger::init(logging::Type logger_type, const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("{}: {}", filename, e.what()));
    }
    return configure(logger_type, root);
}

Result<void> Logger::configure(logging::Type logger_type, const YAML::Node& root) {
    std::shared_ptr<LoggerBackend> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(logger_);
    }
    if (previous) {
        auto closed = previous->shutdown();
        if (!closed) return closed;
    }

    std::shared_ptr<LoggerBackend> created;
    switch (logger_type)
    {
    case logging::Type::SpdLog:
        created = std::make_shared<SpdlogBackend>();
        break;
    default:
        return Error(ResultCode::NotSupported, "unknown logger type");
    }

    auto r = created->init();
    if (!r) return r;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = root;
        logger_ = created;
    }
    return apply();
}

Result<void> Logger::apply() {
    auto logger = backend();
    if (!logger) return Error(ResultCode::InvalidState, "logger is not initialized");

    YAML::Node log;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log = config_["log"];
    }
    if (!log) return OK();

    try {
        auto g_tag = std::string(GLOBAL_TAG);
        if (log[g_tag]) {
            auto node = log[g_tag];

            // Global level 설정
            if (node["level"]) {
                Level level;
                auto name = node["level"].as<std::string>();
                if (!parseLevel(name, level))
                    return Error(ResultCode::InvalidArgument, fmt::format("unknown log level: {}", name));
                auto r = logger->setLevel(g_tag, level);
                if (!r) return r;
            }

            // Global sink 설정
            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto r = configureSink(g_tag, sink);
                    if (!r) return r;
                }
            }
        }

        for (auto it : log) {
            std::string tag = it.first.as<std::string>();
            if (tag == GLOBAL_TAG) continue;
            auto node = it.second;

            if (node["sinks"]) {
                for (auto sink : node["sinks"]) {
                    auto r = configureSink(tag, sink);
                    if (!r) return r;
                }
            }
            auto registered = logger->registerLogger(tag);
            if (!registered) return registered;

            // 레벨 적용
            if (node["level"]) {
                Level level;
                auto name = node["level"].as<std::string>();
                if (!parseLevel(name, level))
                    return Error(ResultCode::InvalidArgument, fmt::format("unknown log level: {}", name));
                auto r = logger->setLevel(tag, level);
                if (!r) return r;
            }

            if (node["enabled"] && !node["enabled"].as<bool>()) {
                auto r = logger->disableTag(tag);
                if (!r) return r;
            }
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("invalid log configuration: {}", e.what()));
    }
    return OK();
}

Result<void> Logger::shutdown() {
    std::shared_ptr<LoggerBackend> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(logger_);
        config_ = YAML::Node();
    }
    if (!previous) return OK();
    return previous->shutdown();
}

void Logger::log(const std::string& tag, Level level, const std::string& msg) {
    auto logger = backend();
    if (logger) logger->log(tag, level, msg);
}

void Logger::flush() {
    auto logger = backend();
    if (logger) logger->flush();
}

Result<void> Logger::setLevel(const std::string& tag, Level level) {
    auto logger = backend();
    if (logger) return logger->setLevel(tag, level);
    return Fail();
}

Result<void> Logger::enableTag(const std::string& tag) {
    auto logger = backend();
    if (logger) return logger->enableTag(tag);
    return Fail();
}

Result<void> Logger::disableTag(const std::string& tag) {
    auto logger = backend();
    if (logger) return logger->disableTag(tag);
    return Fail();
}

bool Logger::initialized() const {
    return backend() != nullptr;
}

std::shared_ptr<LoggerBackend> Logger::backend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_;
}

Result<void> Logger::configureSink(const std::string& tag, const YAML::Node& sink) {
    auto logger = backend();
    if (!logger) return Error(ResultCode::InvalidState, "logger is not initialized");

    if (!sink["type"]) return Error(ResultCode::InvalidArgument, fmt::format("sink without type for tag {}", tag));
    std::string type = sink["type"].as<std::string>();

    if (type == "console") {
        // 기본 콘솔은 registerLogger에서 자동 추가됨
        return logger->setConsoleSink(tag);
    } else if (type == "file") {
        return logger->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        return logger->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<size_t>(),
            sink["max_files"].as<size_t>());
    }
    return Error(ResultCode::NotSupported, fmt::format("unknown sink type: {}", type));
}

} // namespace logging
