#include "type_catalog.hpp"

#include <mutex>

namespace inject {

std::shared_ptr<TypeCatalog> TypeCatalog::global()
{
    // 함수 지역 static → 스레드 세이프 (C++11 이상)
    static std::shared_ptr<TypeCatalog> catalog = std::make_shared<TypeCatalog>();
    return catalog;
}

Result<void> TypeCatalog::add(std::shared_ptr<IConstructor> constructor)
{
    if (!constructor) return Error(ResultCode::InvalidArgument, "null constructor");

    const auto type = constructor->declaringType();
    const auto params = constructor->parameterTypes();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& declared = constructors_[type];
    for (const auto& existing : declared) {
        if (existing->parameterTypes() == params) {
            // 헤더에서 INJECT_CONSTRUCTOR 를 사용하면 TU 마다 등록된다.
            return DuplicateIgnored(constructor->signature());
        }
    }
    declared.push_back(std::move(constructor));
    return OK();
}

std::vector<std::shared_ptr<IConstructor>> TypeCatalog::constructorsOf(TypeKey type) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = constructors_.find(type);
    if (it == constructors_.end())
        return {};
    return it->second;
}

} // namespace inject
