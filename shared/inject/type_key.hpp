#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>

#include "helper.hpp"

namespace inject
{

	// Similar to std::type_index, but interned: exactly one TypeInfo exists per type,
	// so two keys for the same type always compare equal by address.
	struct TypeInfo {

		TypeInfo(const std::type_info& info, bool is_abstract)
			: name_(demangle(info.name())), is_abstract(is_abstract) {}

		const std::string& name() const { return name_; };

		bool isAbstract() const { return is_abstract; };

	private:
		std::string name_;
		bool is_abstract;
	};

	struct TypeKey {
		const TypeInfo* type_info;

		const std::string& name() const { return type_info->name(); };
		bool isAbstract() const { return type_info->isAbstract(); };

		explicit operator std::string() const { return type_info->name(); };

		bool operator==(TypeKey x) const { return type_info == x.type_info; };
		bool operator!=(TypeKey x) const { return type_info != x.type_info; };
		bool operator<(TypeKey x) const { return type_info < x.type_info; };
	};

	template <typename T>
	inline TypeKey getTypeKey() {
		static_assert(std::is_same<T, std::decay_t<T>>::value,
			"type keys are taken on plain (non-reference, non-cv) types");
		// NOTE: 공유 라이브러리 경계마다 별도의 static 이 생길 수 있다.
		static const TypeInfo info(typeid(T), std::is_abstract<T>::value);
		return TypeKey{ &info };
	};

} // namespace inject

namespace std {

	template <>
	struct hash<inject::TypeKey> {
		size_t operator()(inject::TypeKey key) const noexcept {
			return hash<const inject::TypeInfo*>()(key.type_info);
		}
	};

} // namespace std
