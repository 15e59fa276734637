#pragma once
#include <tuple>
#include <utility>
#include <vector>

#include "toymd/base/types.hpp"


namespace toymd::shared::internal {

	// Heterogeneous list: one std::vector per type in Ts, visited in the order of Ts
	// and, within a type, in insertion order. Used to hold the monitors of an integrator.
	template<class... Ts>
	class PackStorage {
	public:
		template <class T>
		requires (same_as_any<T, Ts...>)
		T& add(T item) {
			auto & list = get_list<T>();
			list.push_back(std::move(item));
			return list.back();
		}

		template<typename T>
		requires (same_as_any<T, Ts...>)
		std::vector<T>& get_list() noexcept {
			return std::get<std::vector<T>>(lists);
		}

		template<typename T>
		requires (same_as_any<T, Ts...>)
		const std::vector<T>& get_list() const noexcept {
			return std::get<std::vector<T>>(lists);
		}

		template<typename Func>
		void for_each_item(Func && f) {
			(visit(std::get<std::vector<Ts>>(lists), f), ...);
		}

	private:
		std::tuple<std::vector<Ts>...> lists{};

		template<typename T, typename Func>
		static void visit(std::vector<T> & list, Func & f) {
			for (T & item : list) {
				f(item);
			}
		}
	};
}
