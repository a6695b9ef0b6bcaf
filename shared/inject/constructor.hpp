#pragma once
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

#include "base_constructor.hpp"
#include "resolver.hpp"

namespace inject {

    // T(std::shared_ptr<Args>...)
    // @tparam T    Constructed type
    // @tparam Args Injected parameter types, in declaration order
    template<typename T, typename... Args>
    class Constructor : public BaseConstructor<T>
    {
        static_assert(!std::is_abstract<T>::value, "abstract types have no injectable constructor");
        static_assert(std::is_constructible<T, std::shared_ptr<Args>...>::value,
            "T must be constructible from std::shared_ptr of each parameter type");

    public:
        using Invocation = typename BaseConstructor<T>::Invocation;

        std::vector<TypeKey> parameterTypes() const override
        {
            return { getTypeKey<Args>()... };
        }

        [[nodiscard]] Invocation prepare(Resolver& resolver) const override
        {
            // braced-init-list: 왼쪽에서 오른쪽 순서로 평가된다.
            std::tuple<std::shared_ptr<Args>...> arguments{ resolver.resolve<Args>()... };
            return [arguments]() {
                return std::apply([](const std::shared_ptr<Args>&... args) {
                    return std::make_shared<T>(args...);
                }, arguments);
            };
        }

    }; // class Constructor


} // namespace inject
