#pragma once

#include <memory>
#include <type_traits>

#include "result.h"
#include "type_key.hpp"
#include "injection_failure.hpp"
#include "instance_provider.hpp"
#include "alias_provider.hpp"
#include "binding_registry.hpp"
#include "type_catalog.hpp"
#include "container_config.hpp"
#include "resolution_sink.hpp"
#include "resolver.hpp"


namespace inject {

    // Dependency-resolution container.
    //
    //   inject::Container container;
    //   container.bindInstance<Baz>(std::make_shared<Baz>("hello"));   // fixed instance
    //   container.bindAlias<Fooable, Foo>();                            // interface -> implementation
    //   auto foo = container.resolve<Fooable>();                        // Foo(Bar(Baz), Baz)
    //
    // Types without a binding are built from the constructor declared for them in
    // the type catalog (INJECT_CONSTRUCTOR), resolving each parameter in turn.
    class Container final
    {
    public:
        // NullSink, global catalog
        Container();
        explicit Container(ContainerOptions options);
        ~Container();

        // Copying forbidden
        Container(const Container&) = delete;
        Container& operator=(const Container&) = delete;

        // resolve<T>() 는 항상 value 와 동일한 객체를 반환한다.
        template<typename T, typename V>
        void bindInstance(std::shared_ptr<V> value)
        {
            static_assert(std::is_convertible<V*, T*>::value, "bound instance must be a T");
            std::shared_ptr<T> instance = std::move(value);
            registry_.bind(getTypeKey<T>(), std::make_shared<InstanceProvider<T>>(std::move(instance)));
        }

        // resolve<A>() 는 매번 C 를 resolve 한다. C 는 등록되어 있지 않아도 된다.
        template<typename A, typename C>
        void bindAlias()
        {
            registry_.bind(getTypeKey<A>(), std::make_shared<AliasProvider<A, C>>());
        }

        // Throws InjectionFailure; the cause chain is reachable with std::rethrow_if_nested.
        template<typename T>
        std::shared_ptr<T> resolve() const
        {
            Resolver resolver(registry_, *catalog_, *sink_);
            return resolver.resolve<T>();
        }

        template<typename T>
        Result<std::shared_ptr<T>> tryResolve() const
        {
            try {
                return Result<std::shared_ptr<T>>::OK(resolve<T>());
            } catch (const InjectionFailure& e) {
                auto code = isCyclic(e) ? ResultCode::CyclicDependency : ResultCode::InjectionFailed;
                return Result<std::shared_ptr<T>>::Error(code, formatChain(e));
            }
        }

        template<typename T>
        bool isBound() const
        {
            return registry_.contains(getTypeKey<T>());
        }

        const BindingRegistry& registry() const { return registry_; }
        const TypeCatalog& catalog() const { return *catalog_; }
        const std::shared_ptr<ResolutionSink>& sink() const { return sink_; }

    private:
        BindingRegistry registry_;
        std::shared_ptr<TypeCatalog> catalog_;
        std::shared_ptr<ResolutionSink> sink_;

    }; // class Container


} // namespace inject
