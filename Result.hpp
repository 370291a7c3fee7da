/// @file
/// @brief Field-level outcomes: a Result holds either a value or an Error.
///
/// Conventions:
/// - Result<V> is std::expected<V, Error>; chain with and_then, transform,
///   transform_error and value_or.
/// - Absence in an untrusted document is an Error, never an exception.
#pragma once

#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace nikke_db {

enum class ErrorKind {
  StructuralMiss,  // anchor or navigation step found no node
  AttributeMiss,   // node found, attribute or text absent
  ParseMiss        // raw string matched no known value
};

constexpr const char* Name(ErrorKind x) {
  switch (x) {
    case ErrorKind::StructuralMiss: return "StructuralMiss";
    case ErrorKind::AttributeMiss:  return "AttributeMiss";
    case ErrorKind::ParseMiss:      return "ParseMiss";
    default: return nullptr;
  }
} // Name(ErrorKind)

struct Error {
  ErrorKind kind = ErrorKind::StructuralMiss;
  std::string message;
  std::string context;  // path prefix, attribute name or raw input
  bool operator==(const Error&) const = default;
}; // Error

template<typename V, typename E = Error>
using Result = std::expected<V, E>;

inline std::unexpected<Error>
Fail(ErrorKind kind, std::string message, std::string context = {})
  { return std::unexpected{Error{kind, std::move(message), std::move(context)}}; }

inline std::unexpected<Error>
StructuralMiss(std::string message, std::string path = {})
  { return Fail(ErrorKind::StructuralMiss, std::move(message), std::move(path)); }

inline std::unexpected<Error>
AttributeMiss(std::string message, std::string key = {})
  { return Fail(ErrorKind::AttributeMiss, std::move(message), std::move(key)); }

inline std::unexpected<Error>
ParseMiss(std::string message, std::string raw)
  { return Fail(ErrorKind::ParseMiss, std::move(message), std::move(raw)); }

/// Ok(value) when @p value tests true (a live node, a non-null pointer),
/// otherwise a StructuralMiss carrying @p message.
template<typename T>
Result<T> FromNullish(T value, std::string message) {
  if (!value)
    return StructuralMiss(std::move(message));
  return value;
} // FromNullish

template<typename T>
Result<T> FromNullish(std::optional<T> value, std::string message) {
  if (!value)
    return StructuralMiss(std::move(message));
  return std::move(*value);
} // FromNullish(optional)

/// Error mapper for transform_error: prepends @p prefix to the message and
/// keeps kind and context.
inline auto Prefix(std::string prefix) {
  return [p = std::move(prefix)](Error e) {
    e.message.insert(0, p);
    return e;
  };
} // Prefix

/// A field that may legitimately not apply: a StructuralMiss becomes
/// Ok(nullopt), any other error is kept.
template<typename V>
Result<std::optional<V>> Optional(Result<V> r) {
  if (r)
    return std::optional<V>{std::move(*r)};
  if (r.error().kind == ErrorKind::StructuralMiss)
    return std::optional<V>{};
  return std::unexpected{std::move(r.error())};
} // Optional

inline std::ostream& operator<<(std::ostream& os, const Error& e)
  { return os << e.message; }

} // nikke_db
