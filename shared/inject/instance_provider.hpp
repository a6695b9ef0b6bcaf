#pragma once
#include <memory>

#include "base_provider.hpp"


namespace inject {

    // InstanceProvider는 바인딩된 객체의 소유권을 공유한다.
    // 매 호출마다 동일한 객체를 반환한다.
    // @tparam T Bound type
    template<typename T>
    class InstanceProvider : virtual public BaseProvider<T>
    {

    public:
        explicit InstanceProvider(std::shared_ptr<T> instance)
            : instance_(std::move(instance))
        {

        }

        ~InstanceProvider() override = default;

        std::string name() const override
        {
            return "instance of " + getTypeKey<T>().name();
        }

        [[nodiscard]] std::shared_ptr<T> provide(Resolver&) override
        {
            return instance_;
        }

    private:
        std::shared_ptr<T> instance_;

    }; // class InstanceProvider

} // namespace inject
