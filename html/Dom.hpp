/// @file
/// @brief Read-only helpers over a pugixml tree holding an (X)HTML page.
///
/// Conventions:
/// - Node is a non-owning pugi::xml_node; the xml_document must outlive it.
/// - Element-only traversal: text and comment nodes are skipped.
/// - Plain queries return a null Node on a miss; Require* return a Result.
#pragma once

#include "../Result.hpp"

#include <pugixml.hpp>

#include <gsl-lite/gsl-lite.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace nikke_db::html {

namespace gsl = gsl_lite;

using Node = pugi::xml_node;

/// Options used to load pages: pugixml defaults, which drop comments and
/// whitespace-only text.
constexpr unsigned ParseOptions = pugi::parse_default;

/// Throws std::runtime_error if the file cannot be read or parsed.
void LoadDocument(pugi::xml_document& doc, const std::filesystem::path& path);
void LoadDocument(pugi::xml_document& doc, std::string_view markup,
                  unsigned options = ParseOptions);

bool IsElement(const Node& n);
Node FirstElementChild(const Node& n);
Node LastElementChild(const Node& n);
Node NextElementSibling(const Node& n);
Node PreviousElementSibling(const Node& n);
std::vector<Node> ElementChildren(const Node& n);

/// Concatenated text of all descendants, trimmed.
std::string TextContent(const Node& n);

/// True if the whitespace-separated "class" attribute contains @p cls.
bool HasClass(const Node& n, std::string_view cls);

/// First descendant element with attribute @p key equal to @p value.
Node FindByAttr(const Node& root, gsl::czstring key, std::string_view value);

/// First descendant element with class @p cls; @p tag may be nullptr.
Node FindByClass(const Node& root, gsl::czstring tag, std::string_view cls);

/// Every descendant element with class @p cls, in document order.
std::vector<Node> FindAllByClass(const Node& root, std::string_view cls);

/// AttributeMiss if @p key is absent or empty.
Result<std::string> RequireAttr(const Node& n, gsl::czstring key);

/// AttributeMiss if the trimmed text content is empty.
Result<std::string> RequireText(const Node& n);

/// For and_then chains: node -> attribute value.
inline auto Attr(gsl::czstring key)
  { return [key](const Node& n) { return RequireAttr(n, key); }; }

} // nikke_db::html
