#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "type_key.hpp"

namespace inject
{

    class Resolver;

    // Describes one injectable constructor of a type: its ordered parameter types.
    class IConstructor
    {
    public:
        virtual ~IConstructor() = default;
        virtual TypeKey declaringType() const = 0;
        virtual std::vector<TypeKey> parameterTypes() const = 0;

        // "Foo(Bar, Baz)"
        std::string signature() const
        {
            std::string out = declaringType().name() + "(";
            auto params = parameterTypes();
            for (size_t i = 0; i < params.size(); ++i) {
                if (i) out += ", ";
                out += params[i].name();
            }
            return out + ")";
        }
    }; // interface IConstructor


    template<typename T>
    class BaseConstructor : public IConstructor
    {
    public:
        using Invocation = std::function<std::shared_ptr<T>()>;

        TypeKey declaringType() const override
        {
            return getTypeKey<T>();
        }

        // Resolves every parameter in declaration order and returns the call that
        // runs the constructor body with them. Parameter failures propagate from here;
        // only the returned call runs user code.
        [[nodiscard]] virtual Invocation prepare(Resolver& resolver) const = 0;
    }; // class BaseConstructor


} // namespace inject
