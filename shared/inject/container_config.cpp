#include "container_config.hpp"

#include <fmt/core.h>

#include "resolution_sink.hpp"
#include "type_catalog.hpp"

namespace inject {

Result<ContainerConfig> ContainerConfigLoader::load(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Result<ContainerConfig>::Error(ResultCode::InvalidArgument, fmt::format("{}: {}", path, e.what()));
    }
    return fromNode(root);
}

Result<ContainerConfig> ContainerConfigLoader::loadFromString(const std::string& text)
{
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<ContainerConfig>::Error(ResultCode::InvalidArgument, e.what());
    }
    return fromNode(root);
}

Result<ContainerConfig> ContainerConfigLoader::fromNode(const YAML::Node& root)
{
    ContainerConfig config;
    if (!root.IsDefined() || root.IsNull() || !root["injector"]) {
        return Result<ContainerConfig>::OK(config);
    }

    try {
        auto node = root["injector"];

        auto sink = node["sink"].as<std::string>("none");
        if (sink == "none") {
            config.sink = ContainerConfig::Sink::None;
        } else if (sink == "log") {
            config.sink = ContainerConfig::Sink::Log;
        } else {
            return Result<ContainerConfig>::Error(ResultCode::InvalidArgument,
                fmt::format("unknown injector sink: {}", sink));
        }

        config.tag = node["tag"].as<std::string>(config.tag);
        if (config.tag.empty()) {
            return Result<ContainerConfig>::Error(ResultCode::InvalidArgument, "injector tag must not be empty");
        }

        if (node["level"]) {
            auto level = node["level"].as<std::string>();
            if (!logging::parseLevel(level, config.level)) {
                return Result<ContainerConfig>::Error(ResultCode::InvalidArgument,
                    fmt::format("unknown injector level: {}", level));
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<ContainerConfig>::Error(ResultCode::InvalidArgument,
            fmt::format("invalid injector configuration: {}", e.what()));
    }

    return Result<ContainerConfig>::OK(config);
}

ContainerOptions makeContainerOptions(const ContainerConfig& config)
{
    ContainerOptions options;
    switch (config.sink) {
    case ContainerConfig::Sink::Log:
        options.sink = std::make_shared<LoggingSink>(config.tag, config.level);
        break;
    case ContainerConfig::Sink::None:
        options.sink = std::make_shared<NullSink>();
        break;
    }
    options.catalog = TypeCatalog::global();
    return options;
}

const char* sinkName(ContainerConfig::Sink sink)
{
    switch (sink) {
        case ContainerConfig::Sink::None: return "none";
        case ContainerConfig::Sink::Log:  return "log";
    }
    return "none";
}

} // namespace inject
