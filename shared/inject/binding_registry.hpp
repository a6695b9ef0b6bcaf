#pragma once
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "type_key.hpp"
#include "base_provider.hpp"


namespace inject {

	// Explicit bindings of a single container.
	//
	//  ---------------------------------------
	// |  TypeKey   |   Provider               |
	// |---------------------------------------|
	// |  Baz       |   InstanceProvider<Baz>  |
	// |  Fooable   |   AliasProvider<Fooable, |
	// |            |                 Foo>     |
	//  ---------------------------------------
	//
	// Readers share the lock; the lock is never held while a provider runs.
	class BindingRegistry
	{
		using ProviderMap = std::unordered_map<TypeKey, std::shared_ptr<IProvider>>;

	public:
		BindingRegistry() = default;
		~BindingRegistry() = default;

		BindingRegistry(const BindingRegistry&) = delete;
		BindingRegistry& operator=(const BindingRegistry&) = delete;

		// 동일한 type이 이미 등록되어 있으면 덮어쓴다. (last bind wins)
		void bind(TypeKey type, std::shared_ptr<IProvider> provider);

		// 등록된 provider, 없으면 nullptr
		[[nodiscard]] std::shared_ptr<IProvider> lookup(TypeKey type) const;

		[[nodiscard]] bool contains(TypeKey type) const;
		[[nodiscard]] size_t size() const;

	private:
		ProviderMap providers_;
		mutable std::shared_mutex mutex_;
	}; // class BindingRegistry


} // namespace inject
