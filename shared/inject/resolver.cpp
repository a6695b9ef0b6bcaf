#include "resolver.hpp"

#include <algorithm>

#include "binding_registry.hpp"
#include "type_catalog.hpp"
#include "resolution_sink.hpp"
#include "logging.hpp"

namespace inject {

Resolver::Resolver(const BindingRegistry& registry, const TypeCatalog& catalog, ResolutionSink& sink)
    : registry_(registry), catalog_(catalog), sink_(sink)
{
}

Resolver::~Resolver() = default;

void Resolver::notify(TypeKey type)
{
    try {
        sink_.onResolve(type);
    } catch (const std::exception& e) {
        // sink 오류는 resolve 결과에 영향을 주지 않는다.
        LOGW("Resolution sink failed for {}: {}", type.name(), e.what());
    } catch (...) {
        LOGW("Resolution sink failed for {}: unknown error", type.name());
    }
}

void Resolver::enter(TypeKey type)
{
    if (std::find(in_progress_.begin(), in_progress_.end(), type) != in_progress_.end()) {
        std::string cycle;
        for (const auto& step : in_progress_) {
            cycle += step.name();
            cycle += " -> ";
        }
        cycle += type.name();
        throw CyclicDependency(fmt::format("Cyclic dependency while resolving {}: {}", type.name(), cycle));
    }
    in_progress_.push_back(type);
}

void Resolver::leave()
{
    in_progress_.pop_back();
}

std::shared_ptr<IProvider> Resolver::lookup(TypeKey type) const
{
    return registry_.lookup(type);
}

std::vector<std::shared_ptr<IConstructor>> Resolver::constructorsOf(TypeKey type) const
{
    return catalog_.constructorsOf(type);
}

void Resolver::throwNoValidConstructor(TypeKey type, size_t count) const
{
    if (type.isAbstract()) {
        throw InjectionFailure(fmt::format(
            "Unable to find a valid constructor on {} (abstract type, no binding)", type.name()));
    }
    throw InjectionFailure(fmt::format(
        "Unable to find a valid constructor on {} ({} injectable constructors declared)", type.name(), count));
}

} // namespace inject
