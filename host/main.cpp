#include <iostream>

#include "logging.hpp"
#include "inject.hpp"
#include "greeting.hpp"

static constexpr const char* TAG = "Host";

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "injector.yaml";

    // YAML 기반 설정 적용
    auto logged = logging::init(logging::Type::SpdLog, config_path);
    if (!logged) {
        std::cerr << "logging init failed: " << to_string(logged) << std::endl;
        return 1;
    }

    auto config = inject::ContainerConfigLoader::load(config_path);
    if (!config) {
        LOG_ERROR(TAG, "injector config: {}", config.error().value_or(to_string(config.code())));
        return 1;
    }
    LOG_INFO(TAG, "resolution sink: {} (tag {}, level {})", inject::sinkName(config.value().sink),
        config.value().tag, logging::levelName(config.value().level));

    inject::Container container(inject::makeContainerOptions(config.value()));
    container.bindInstance<host::Greeting>(std::make_shared<host::Greeting>("hello world"));
    container.bindAlias<host::MessageSource, host::GreetingSource>();

    auto printer = container.tryResolve<host::Printer>();
    if (!printer) {
        LOG_ERROR(TAG, "resolve failed ({}): {}", to_string(printer.code()), printer.error().value_or(""));
        return 1;
    }

    std::cout << printer.value()->render() << std::endl;

    // 자기 자신을 가리키는 alias 는 cycle 로 실패한다.
    container.bindAlias<host::MessageSource, host::MessageSource>();
    try {
        container.resolve<host::Printer>();
    } catch (const inject::InjectionFailure& e) {
        LOG_WARN(TAG, "expected failure: {}", inject::formatChain(e));
    }

    auto closed = logging::Logger::instance().shutdown();
    if (!closed) {
        std::cerr << "logging shutdown failed: " << to_string(closed) << std::endl;
        return 1;
    }
    return 0;
}
