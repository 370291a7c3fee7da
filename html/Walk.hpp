/// @file
/// @brief Navigate an element tree with a compact direction string.
///
/// Directives, applied left to right:
///   '^'  parent element
///   '>'  next element sibling
///   '<'  previous element sibling
///   'v'  first element child
///   '$'  last element child
///
/// The first step that finds no node stops the walk with a StructuralMiss
/// naming the path consumed before it, e.g. "missing child at path 'v$v'"
/// ('root' when nothing was consumed). Error::context holds that prefix.
/// An empty path returns the start node.
#pragma once

#include "Dom.hpp"

#include <string>
#include <string_view>

namespace nikke_db::html {

Result<Node> Walk(const Node& start, std::string_view path);

/// Walk(), bound to @p path, for use with and_then.
inline auto Walker(std::string path) {
  return [p = std::move(path)](const Node& n) { return Walk(n, p); };
}

Result<Node> FirstChild(const Node& n);
Result<Node> LastChild(const Node& n);

} // nikke_db::html
