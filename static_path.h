// Compile-time path operations
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef STATIC_PATH_H
#define STATIC_PATH_H

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

template <std::size_t Length> struct StaticPath {
  constexpr StaticPath() = default;
  constexpr StaticPath(const char (&src)[Length + 1]) noexcept {
    for (std::size_t i = 0; i < Length; ++i)
      data[i] = src[i];
  }

  static constexpr std::size_t size() noexcept { return Length; }

  constexpr std::string_view view() const noexcept { return {data, Length}; }

  std::string str() const { return std::string{view()}; }

  std::filesystem::path path() const { return std::filesystem::path{view()}; }

  operator std::filesystem::path() const { return std::filesystem::path{data}; }

  operator const char *() const { return data; }

  operator std::string_view() const { return {data, Length}; }

  operator std::string() const { return {data, Length}; }

  char data[Length + 1] = {};
};
template <std::size_t LengthPlusOne>
StaticPath(const char (&src)[LengthPlusOne]) -> StaticPath<LengthPlusOne - 1>;

namespace detail {
template <std::size_t LengthA, std::size_t LengthB>
constexpr StaticPath<LengthA + 1 + LengthB> join(const char *a, const char *b) {
  StaticPath<LengthA + 1 + LengthB> ret;

  std::size_t out = 0;
  for (std::size_t i = 0; i < LengthA; ++i)
    ret.data[out++] = a[i];

  ret.data[out++] = '/';

  for (std::size_t i = 0; i < LengthB; ++i)
    ret.data[out++] = b[i];

  return ret;
}
} // namespace detail

template <std::size_t LengthA, std::size_t LengthB>
constexpr auto operator/(const StaticPath<LengthA> &a,
                         const StaticPath<LengthB> &b) {
  return detail::join<LengthA, LengthB>(a.data, b.data);
}

template <std::size_t LengthA, std::size_t LengthBPlusOne>
constexpr auto operator/(const StaticPath<LengthA> &a,
                         const char (&b)[LengthBPlusOne]) {
  return detail::join<LengthA, LengthBPlusOne - 1>(a.data, b);
}

template <std::size_t Length> auto format_as(const StaticPath<Length> &path) {
  return path.view();
}

#endif
