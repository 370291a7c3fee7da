#include "Walk.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <iterator>

namespace nikke_db::html {

namespace {

std::string Quoted(std::string_view prefix) {
  auto out = std::string{"'"};
  out += prefix.empty() ? std::string_view{"root"} : prefix;
  out += "'";
  return out;
} // Quoted

Node Step(const Node& n, char dir) {
  switch (dir) {
    case '^': {
      auto p = n.parent();
      return IsElement(p) ? p : Node{};
    }
    case '>': return NextElementSibling(n);
    case '<': return PreviousElementSibling(n);
    case 'v': return FirstElementChild(n);
    case '$': return LastElementChild(n);
    default:  return Node{};
  }
} // Step

gsl::czstring Missing(char dir) {
  switch (dir) {
    case '^': return "missing parent";
    case '>': return "missing next sibling";
    case '<': return "missing previous sibling";
    case 'v':
    case '$': return "missing child";
    default:  return nullptr;
  }
} // Missing

} // local

Result<Node> Walk(const Node& start, std::string_view path) {
  if (!start)
    return StructuralMiss("no start node", std::string{});
  auto node = start;
  for (auto i = gsl::index{0}; i != std::ssize(path); ++i) {
    const auto dir = path[i];
    const auto prefix = path.substr(0, i);
    auto what = Missing(dir);
    if (!what) {
      auto msg = std::string{"unknown directive '"} + dir + "' at path "
               + Quoted(prefix);
      return StructuralMiss(std::move(msg), std::string{prefix});
    }
    node = Step(node, dir);
    if (!node) {
      return StructuralMiss(std::string{what} + " at path " + Quoted(prefix),
                            std::string{prefix});
    }
  }
  return node;
} // Walk

Result<Node> FirstChild(const Node& n) {
  return FromNullish(FirstElementChild(n),
                     std::string{"<"} + n.name() + "> has no element child");
} // FirstChild

Result<Node> LastChild(const Node& n) {
  return FromNullish(LastElementChild(n),
                     std::string{"<"} + n.name() + "> has no element child");
} // LastChild

} // nikke_db::html
