#pragma once
#include <type_traits>

#include "base_provider.hpp"
#include "resolver.hpp"

namespace inject {

    // AliasProvider는 요청마다 concrete type을 다시 resolve 한다. (캐시하지 않음)
    // @tparam A Abstract (requested) type
    // @tparam C Concrete type resolved in its place
    template<typename A, typename C>
    class AliasProvider : virtual public BaseProvider<A>
    {
        static_assert(std::is_base_of<A, C>::value || std::is_same<A, C>::value,
            "alias target must derive from the bound type");

    public:
        AliasProvider() = default;

        ~AliasProvider() override = default;

        std::string name() const override
        {
            return "alias to " + getTypeKey<C>().name();
        }

        [[nodiscard]] std::shared_ptr<A> provide(Resolver& resolver) override
        {
            return resolver.resolve<C>();
        }

    }; // class AliasProvider


} // namespace inject
