#pragma once
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

#include "result.h"
#include "type_key.hpp"
#include "base_constructor.hpp"
#include "constructor.hpp"


namespace inject {

	// Injectable constructors per type. Stands in for constructor introspection:
	// a type is structurally constructible only through the constructors declared here.
	//
	//  ----------------------------------------------
	// |  TypeKey   |   Constructors                  |
	// |----------------------------------------------|
	// |  Foo       |   [ Foo(Bar, Baz) ]             |
	// |  Multi     |   [ Multi(Bogus), Multi(A, B) ] |
	//  ----------------------------------------------
	class TypeCatalog
	{
		using ConstructorMap = std::map<TypeKey, std::vector<std::shared_ptr<IConstructor>>>;

	public:
		TypeCatalog() = default;
		~TypeCatalog() = default;

		TypeCatalog(const TypeCatalog&) = delete;
		TypeCatalog& operator=(const TypeCatalog&) = delete;

		// INJECT_CONSTRUCTOR 로 등록되는 프로세스 전역 catalog
		static std::shared_ptr<TypeCatalog> global();

		// Declares T(std::shared_ptr<Args>...) as injectable.
		template<typename T, typename... Args>
		Result<void> declare()
		{
			return add(std::make_shared<Constructor<T, Args...>>());
		}

		// 동일한 signature가 이미 있으면 DuplicateIgnored 를 반환한다.
		Result<void> add(std::shared_ptr<IConstructor> constructor);

		[[nodiscard]] std::vector<std::shared_ptr<IConstructor>> constructorsOf(TypeKey type) const;

		template<typename T>
		[[nodiscard]] std::vector<std::shared_ptr<IConstructor>> constructorsOf() const
		{
			return constructorsOf(getTypeKey<T>());
		}

	private:
		ConstructorMap constructors_;
		mutable std::shared_mutex mutex_;
	}; // class TypeCatalog


	// Registers a constructor in the global catalog during static initialisation.
	template<typename T, typename... Args>
	struct ConstructorRegistrar
	{
		ConstructorRegistrar()
			: result(TypeCatalog::global()->declare<T, Args...>())
		{
		}

		const Result<void> result;
	}; // struct ConstructorRegistrar


} // namespace inject

#define INJECT_CONCAT_IMPL(a, b) a##b
#define INJECT_CONCAT(a, b) INJECT_CONCAT_IMPL(a, b)

// INJECT_CONSTRUCTOR(Foo, Bar, Baz) declares Foo(std::shared_ptr<Bar>, std::shared_ptr<Baz>).
// Use at namespace scope.
#define INJECT_CONSTRUCTOR(...)                                               \
  static const ::inject::ConstructorRegistrar<__VA_ARGS__>                    \
      INJECT_CONCAT(inject_constructor_registrar_, __COUNTER__){}
