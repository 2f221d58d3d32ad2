// reflect-based argument parser
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef ARGPARSER_H
#define ARGPARSER_H

#include <algorithm>
#include <charconv>
#include <concepts>
#include <optional>
#include <ranges>
#include <reflect>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace argparser {

struct Opts {
  char shortName = 0;
};

template <class T, Opts opts = {}> struct Option : public T {
  using T::T;
  static constexpr Opts argparser_options = opts;
};

template <std::integral T, Opts opts> struct Option<T, opts> {
  static constexpr Opts argparser_options = opts;

  constexpr Option() = default;
  constexpr Option(T data) : m_data{data} {}

  operator T() const noexcept { return m_data; }

  T &get() noexcept { return m_data; }

private:
  T m_data{};
};

// Collects everything from the first non-option argument (or after "--")
class PositionalArguments : public std::vector<std::string> {
public:
  using vector::vector;
};

class ArgumentException : public std::runtime_error {
public:
  explicit ArgumentException(const std::string &msg)
      : std::runtime_error{msg} {}
};

namespace detail {
template <typename T> struct Unwrapper {
  using type = T;
  static constexpr Opts opts = {};
};
template <typename T, Opts o> struct Unwrapper<Option<T, o>> {
  using type = T;
  static constexpr Opts opts = o;
};

template <typename T> using UnwrapOption = typename Unwrapper<T>::type;

template <typename T> constexpr Opts GetOpts = Unwrapper<T>::opts;

template <typename T> constexpr bool IsVector = false;
template <typename U> constexpr bool IsVector<std::vector<U>> = true;

template <typename T> constexpr bool IsOptional = false;
template <typename U> constexpr bool IsOptional<std::optional<U>> = true;

template <typename T> T &ref(T &value) { return value; }

template <typename T, Opts o> T &ref(Option<T, o> &value) {
  return static_cast<T &>(value);
}

template <std::integral T, Opts o> T &ref(Option<T, o> &value) {
  return value.get();
}

template <typename T>
void parseValue(T &target, std::string_view name, std::string_view value) {
  if constexpr (std::is_same_v<T, std::string>)
    target = std::string{value};
  else if constexpr (std::integral<T>) {
    auto [end, ec] =
        std::from_chars(value.data(), value.data() + value.size(), target);
    if (ec != std::errc{} || end != value.data() + value.size())
      throw ArgumentException{
          fmt::format("Could not parse '{}' as value for --{}", value, name)};
  } else
    static_assert(std::is_same_v<T, std::string>,
                  "Unsupported option type");
}

template <typename ArgClass> constexpr bool hasPositionalArguments() {
  return []<std::size_t... Ns>(std::index_sequence<Ns...>) {
    return (... ||
            std::is_same_v<std::remove_cvref_t<decltype(reflect::get<Ns>(
                               std::declval<ArgClass &>()))>,
                           PositionalArguments>);
  }(std::make_index_sequence<reflect::size<ArgClass>()>());
}

template <typename ArgClass>
PositionalArguments *getPositionalArguments(ArgClass &args) {
  PositionalArguments *ret{};

  [&]<std::size_t... Ns>(std::index_sequence<Ns...>) {
    (..., [&](auto &member) {
      if constexpr (std::is_same_v<std::remove_cvref_t<decltype(member)>,
                                   PositionalArguments>)
        ret = &member;
    }(reflect::get<Ns>(args)));
  }(std::make_index_sequence<reflect::size<ArgClass>()>());

  return ret;
}
} // namespace detail

template <typename T>
concept argument_list =
    std::ranges::random_access_range<T> &&
    std::is_convertible_v<std::ranges::range_value_t<T>, std::string_view>;

template <typename ArgClass> class Parser {
public:
  explicit Parser(ArgClass &args) : m_args{args} {}

  // May be called multiple times, e.g. for arguments from the environment
  // followed by the command line. Positional arguments accumulate.
  template <argument_list ArgumentList>
  void parse(const ArgumentList &arguments) {
    using namespace std::literals;

    constexpr bool ACCEPTS_POSITIONAL =
        detail::hasPositionalArguments<ArgClass>();

    const std::size_t count = std::ranges::size(arguments);
    for (std::size_t i = 0; i < count; ++i) {
      auto arg = std::string_view{arguments[i]};

      bool startsPositional = !arg.starts_with("-"sv) || arg == "-"sv;
      if (startsPositional || arg == "--"sv) {
        if constexpr (ACCEPTS_POSITIONAL) {
          auto positional = detail::getPositionalArguments(m_args);
          for (std::size_t j = startsPositional ? i : i + 1; j < count; ++j)
            positional->emplace_back(std::string_view{arguments[j]});
          return;
        } else
          throw ArgumentException{fmt::format("Invalid argument '{}'", arg)};
      }

      bool isLong = arg.starts_with("--"sv);
      std::string_view argName = isLong ? arg.substr(2) : arg.substr(1);

      // --X=Y
      std::string key;
      std::optional<std::string_view> value;
      if (auto eq = argName.find('='); eq != std::string_view::npos) {
        key = argName.substr(0, eq);
        value = argName.substr(eq + 1);
      } else
        key = argName;

      if (!isLong && key.length() != 1)
        throw ArgumentException{fmt::format("Invalid short option '-{}'", key)};

      std::ranges::replace(key, '-', '_');
      char shortKey = isLong ? 0 : key[0];

      auto fetchValue = [&]() -> std::string_view {
        if (value)
          return *value;

        if (i + 1 == count)
          throw ArgumentException{fmt::format("'{}' requires an argument", arg)};

        return std::string_view{arguments[++i]};
      };

      bool found = [&]<std::size_t... Ns>(std::index_sequence<Ns...>) {
        return (... || assign<Ns>(key, shortKey, fetchValue));
      }(std::make_index_sequence<reflect::size<ArgClass>()>());

      if (!found)
        throw ArgumentException{fmt::format("Unknown argument '{}'", arg)};
    }
  }

private:
  template <std::size_t N, typename Fetch>
  bool assign(const std::string &key, char shortKey, Fetch &fetchValue) {
    auto &member = reflect::get<N>(m_args);
    using Member = std::remove_cvref_t<decltype(member)>;

    if constexpr (std::is_same_v<Member, PositionalArguments>)
      return false;
    else {
      using Value = detail::UnwrapOption<Member>;
      constexpr Opts opts = detail::GetOpts<Member>;

      if (shortKey) {
        if (opts.shortName != shortKey)
          return false;
      } else if (key != reflect::member_name<N, ArgClass>())
        return false;

      std::string_view name = reflect::member_name<N, ArgClass>();
      Value &target = detail::ref(member);

      if constexpr (detail::IsVector<Value>)
        detail::parseValue(target.emplace_back(), name, fetchValue());
      else if constexpr (detail::IsOptional<Value>)
        detail::parseValue(target.emplace(), name, fetchValue());
      else if constexpr (std::is_same_v<Value, bool>)
        target = true;
      else
        detail::parseValue(target, name, fetchValue());

      return true;
    }
  }

  ArgClass &m_args;
};

template <typename ArgClass, argument_list Container>
void parse(ArgClass &args, const Container &arguments) {
  Parser parser{args};
  parser.parse(arguments);
}

} // namespace argparser

#endif
