#pragma once
#include <memory>
#include <string>
#include <yaml-cpp/yaml.h>

#include "result.h"
#include "logging_def.hpp"

namespace inject {

class ResolutionSink;
class TypeCatalog;

// ---------------------------
// injector 설정 구조체
// ---------------------------
struct ContainerConfig {
    enum class Sink { None, Log };

    Sink sink = Sink::None;                         // resolution 기록을 보낼 곳
    std::string tag = "Injector";                   // Sink::Log 일 때 logging tag
    logging::Level level = logging::Level::Info;    // Sink::Log 일 때 기록 level
};

// Container 생성 인자. 비어 있는 항목은 기본값(NullSink, 전역 catalog)으로 채워진다.
struct ContainerOptions {
    std::shared_ptr<ResolutionSink> sink;
    std::shared_ptr<TypeCatalog> catalog;
};

class ContainerConfigLoader {
public:
    // "injector" 노드가 없으면 기본 설정
    static Result<ContainerConfig> load(const std::string& path);
    static Result<ContainerConfig> loadFromString(const std::string& text);
    static Result<ContainerConfig> fromNode(const YAML::Node& root);
};

ContainerOptions makeContainerOptions(const ContainerConfig& config);

const char* sinkName(ContainerConfig::Sink sink);

} // namespace inject
