#pragma once

#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <wirebind/core/types.h>
#include <wirebind/protocol/structured_value.h>

namespace wirebind {

// C++ types the engine knows how to put on, and take off, the wire

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_list : std::false_type {};
template <typename E, typename A> struct is_list<std::vector<E, A>> : std::true_type {};

template <typename T> struct is_string_map : std::false_type {};
template <typename V, typename C, typename A>
struct is_string_map<std::map<std::string, V, C, A>> : std::true_type {};

template <typename T>
concept OptionalValue = is_optional<T>::value;

template <typename T>
concept ScalarValue = std::same_as<T, std::string> || std::same_as<T, int32_t> ||
                      std::same_as<T, int64_t> || std::same_as<T, double> ||
                      std::same_as<T, bool> || std::same_as<T, TimePoint> ||
                      std::same_as<T, ByteVector>;

template <typename T>
concept ListValue = is_list<T>::value && !std::same_as<T, ByteVector>;

template <typename T>
concept MapValue = is_string_map<T>::value;

template <typename T>
concept WireValue = OptionalValue<T> || ScalarValue<T> || ListValue<T> || MapValue<T> ||
                    StructuredShape<T>;

template <typename> inline constexpr bool always_false_v = false;

} // namespace wirebind
