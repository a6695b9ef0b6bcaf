#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "result.h"
#include "logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

class Logger {
public:
    static Logger& instance();

    // YAML 파일을 읽고 backend 생성 후 설정을 적용한다.
    Result<void> init(logging::Type logger, const std::string& filename);

    // 이미 파싱된 문서의 "log" 노드로 backend를 (재)구성한다.
    Result<void> configure(logging::Type logger, const YAML::Node& root);

    Result<void> apply();
    Result<void> shutdown();

    void log(const std::string& tag, Level level, const std::string& msg);
    void flush();

    Result<void> setLevel(const std::string& tag, Level level);
    Result<void> enableTag(const std::string& tag);
    Result<void> disableTag(const std::string& tag);

    bool initialized() const;

private:
    Logger() = default;
    ~Logger();

    // 복사/이동 금지
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<LoggerBackend> backend() const;
    Result<void> configureSink(const std::string& tag, const YAML::Node& sink);

    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
    mutable std::mutex mutex_;
};

} // namespace logging
