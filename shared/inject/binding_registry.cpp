#include "binding_registry.hpp"

#include <mutex>

namespace inject {

void BindingRegistry::bind(TypeKey type, std::shared_ptr<IProvider> provider)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    providers_[type] = std::move(provider);
}

std::shared_ptr<IProvider> BindingRegistry::lookup(TypeKey type) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = providers_.find(type);
    if (it == providers_.end())
        return nullptr;
    return it->second;
}

bool BindingRegistry::contains(TypeKey type) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return providers_.find(type) != providers_.end();
}

size_t BindingRegistry::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return providers_.size();
}

} // namespace inject
