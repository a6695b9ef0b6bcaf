#pragma once

#include <memory>
#include "type_key.hpp"

namespace inject
{

    class Resolver;

    class IProvider
    {
    public:
        virtual ~IProvider() = default;
        virtual TypeKey providedType() const = 0;
        virtual std::string name() const = 0;
    }; // interface IProvider


    // Resolution strategy attached to a binding for T.
    template<typename T>
    class BaseProvider : virtual public IProvider
    {
    public:
        ~BaseProvider() override = default;

        TypeKey providedType() const override
        {
            return getTypeKey<T>();
        }

        // May call back into the resolver; failures propagate as exceptions.
        [[nodiscard]] virtual std::shared_ptr<T> provide(Resolver& resolver) = 0;
    }; // class BaseProvider


} // namespace inject
