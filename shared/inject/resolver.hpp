#pragma once

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "type_key.hpp"
#include "base_provider.hpp"
#include "base_constructor.hpp"
#include "injection_failure.hpp"


namespace inject {

    class BindingRegistry;
    class TypeCatalog;
    class ResolutionSink;

    // One top-level resolution: a stateless traversal of the dependency graph
    // rooted at the requested type. The only state is the stack of types
    // currently being resolved, used to reject cycles.
    class Resolver
    {
    public:
        inline static constexpr const char* LOG_TAG = "Injector";

        Resolver(const BindingRegistry& registry, const TypeCatalog& catalog, ResolutionSink& sink);
        ~Resolver();

        Resolver(const Resolver&) = delete;
        Resolver& operator=(const Resolver&) = delete;

        template<typename T>
        std::shared_ptr<T> resolve()
        {
            const TypeKey type = getTypeKey<T>();
            notify(type);
            ResolutionScope scope(*this, type);

            // Bindings always win over structural construction.
            auto provider = lookup(type);
            if (provider) {
                return provide<T>(type, provider);
            }
            return construct<T>(type);
        }

        // Types currently being resolved, outermost first.
        const std::vector<TypeKey>& path() const { return in_progress_; }

    private:
        // Marks a type as in progress for the lifetime of one resolve frame.
        class ResolutionScope
        {
        public:
            ResolutionScope(Resolver& resolver, TypeKey type)
                : resolver_(resolver)
            {
                resolver_.enter(type);
            }

            ~ResolutionScope()
            {
                resolver_.leave();
            }

        private:
            // copying forbidden
            ResolutionScope(const ResolutionScope&) = delete;
            void operator=(const ResolutionScope&) = delete;

            Resolver& resolver_;
        }; // class ResolutionScope

        template<typename T>
        std::shared_ptr<T> provide(TypeKey type, const std::shared_ptr<IProvider>& provider)
        {
            std::shared_ptr<T> result;
            try {
                // The provider may call back into resolve (aliases), so failures
                // arriving here can already be nested several levels deep.
                auto* typed = dynamic_cast<BaseProvider<T>*>(provider.get());
                if (!typed) {
                    throw InjectionFailure(fmt::format("Provider {} bound to {} produces {}",
                        provider->name(), type.name(), provider->providedType().name()));
                }
                result = typed->provide(*this);
            } catch (...) {
                std::throw_with_nested(InjectionFailure(
                    fmt::format("Error while trying to inject {}", type.name())));
            }
            return result;
        }

        template<typename T>
        std::shared_ptr<T> construct(TypeKey type)
        {
            auto constructors = constructorsOf(type);
            if (constructors.size() != 1) {
                throwNoValidConstructor(type, constructors.size());
            }

            auto* constructor = dynamic_cast<const BaseConstructor<T>*>(constructors.front().get());
            if (!constructor) {
                throw InjectionFailure(fmt::format("Constructor {} does not construct {}",
                    constructors.front()->signature(), type.name()));
            }

            // Parameter failures propagate unwrapped; nothing has been constructed yet.
            auto invocation = constructor->prepare(*this);

            std::shared_ptr<T> result;
            try {
                result = invocation();
            } catch (...) {
                std::throw_with_nested(InjectionFailure(
                    fmt::format("Error invoking constructor of {}", type.name())));
            }
            return result;
        }

        void notify(TypeKey type);
        void enter(TypeKey type);
        void leave();

        std::shared_ptr<IProvider> lookup(TypeKey type) const;
        std::vector<std::shared_ptr<IConstructor>> constructorsOf(TypeKey type) const;

        [[noreturn]] void throwNoValidConstructor(TypeKey type, size_t count) const;

    private:
        const BindingRegistry& registry_;
        const TypeCatalog& catalog_;
        ResolutionSink& sink_;
        std::vector<TypeKey> in_progress_;

    }; // class Resolver

} // namespace inject
