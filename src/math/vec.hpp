#pragma once
#include <cmath>
#include <concepts>
#include <tuple>
#include <type_traits>
#include "types.hpp"

template<Numeric T>
struct Vec3 {
	T x {}, y {}, z {};

	template<Numeric U>
	[[nodiscard]] static Vec3 from(U value) {
		auto v = as<T>(value);
		return {v, v, v};
	}

	template<typename A, typename B, typename C>
		requires Numeric<std::remove_cvref_t<A>> && Numeric<std::remove_cvref_t<B>> && Numeric<std::remove_cvref_t<C>>
	[[nodiscard]] static Vec3 from(const std::tuple<A, B, C>& values) {
		return {as<T>(std::get<0>(values)), as<T>(std::get<1>(values)), as<T>(std::get<2>(values))};
	}

	template<Numeric U>
	[[nodiscard]] static Vec3 splat(U value) {
		return from(value);
	}

	[[nodiscard]] constexpr T dot(const Vec3& rhs) const noexcept requires std::floating_point<T> {
		return x * rhs.x + y * rhs.y + z * rhs.z;
	}

	[[nodiscard]] constexpr Vec3 cross(const Vec3& rhs) const noexcept requires std::floating_point<T> {
		return {
			y * rhs.z - z * rhs.y,
			z * rhs.x - x * rhs.z,
			x * rhs.y - y * rhs.x
		};
	}

	[[nodiscard]] constexpr T length_squared() const noexcept requires std::floating_point<T> {
		return dot(*this);
	}

	[[nodiscard]] T length() const noexcept requires std::floating_point<T> {
		return std::sqrt(length_squared());
	}

	// zero (and nan) vectors are returned as is
	[[nodiscard]] Vec3 normalize() const noexcept requires std::floating_point<T> {
		auto sqr_len = length_squared();
		if (sqr_len > T {0}) {
			return *this * (T {1} / std::sqrt(sqr_len));
		}
		return *this;
	}

	constexpr Vec3 operator*(T rhs) const noexcept requires std::floating_point<T> {
		return {x * rhs, y * rhs, z * rhs};
	}

	constexpr Vec3 operator-() const noexcept requires std::floating_point<T> {
		return {-x, -y, -z};
	}

	constexpr bool operator==(const Vec3& rhs) const = default;
};
