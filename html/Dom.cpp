#include "Dom.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace nikke_db::html {

namespace {

class ClassCollector : public pugi::xml_tree_walker {
public:
  explicit ClassCollector(std::string_view cls) : _cls{cls} { }
  bool for_each(pugi::xml_node& n) override {
    if (HasClass(n, _cls))
      found.push_back(n);
    return true;
  }
  std::vector<Node> found;
private:
  std::string_view _cls;
}; // ClassCollector

class TextCollector : public pugi::xml_tree_walker {
public:
  bool for_each(pugi::xml_node& n) override {
    auto t = n.type();
    if (t == pugi::node_pcdata || t == pugi::node_cdata)
      text += n.value();
    return true;
  }
  std::string text;
}; // TextCollector

void CheckLoad(const pugi::xml_parse_result& res, std::string_view what) {
  if (res)
    return;
  auto msg = std::string{"XML parse error for '"};
  msg += what;
  msg += "': ";
  msg += res.description();
  msg += " at offset " + std::to_string(res.offset);
  throw std::runtime_error{msg};
} // CheckLoad

} // local

void LoadDocument(pugi::xml_document& doc, const std::filesystem::path& path)
{
  // Keep a stable string; pugixml's load_file expects c-string
  const auto path_str = path.string();
  CheckLoad(doc.load_file(path_str.c_str(), ParseOptions), path_str);
} // LoadDocument(path)

void LoadDocument(pugi::xml_document& doc, std::string_view markup,
                  unsigned options)
{
  CheckLoad(doc.load_buffer(markup.data(), markup.size(), options),
            "<buffer>");
} // LoadDocument(markup)

bool IsElement(const Node& n) { return n.type() == pugi::node_element; }

Node FirstElementChild(const Node& n) {
  for (auto c = n.first_child(); c; c = c.next_sibling()) {
    if (IsElement(c))
      return c;
  }
  return Node{};
} // FirstElementChild

Node LastElementChild(const Node& n) {
  for (auto c = n.last_child(); c; c = c.previous_sibling()) {
    if (IsElement(c))
      return c;
  }
  return Node{};
} // LastElementChild

Node NextElementSibling(const Node& n) {
  for (auto s = n.next_sibling(); s; s = s.next_sibling()) {
    if (IsElement(s))
      return s;
  }
  return Node{};
} // NextElementSibling

Node PreviousElementSibling(const Node& n) {
  for (auto s = n.previous_sibling(); s; s = s.previous_sibling()) {
    if (IsElement(s))
      return s;
  }
  return Node{};
} // PreviousElementSibling

std::vector<Node> ElementChildren(const Node& n) {
  auto out = std::vector<Node>{};
  for (auto c: n.children()) {
    if (IsElement(c))
      out.push_back(c);
  }
  return out;
} // ElementChildren

std::string TextContent(const Node& n) {
  auto t = n.type();
  if (t == pugi::node_pcdata || t == pugi::node_cdata)
    return boost::algorithm::trim_copy(std::string{n.value()});
  auto collector = TextCollector{};
  // traverse() takes a non-const node; it does not modify the tree.
  auto walk = n;
  walk.traverse(collector);
  boost::algorithm::trim(collector.text);
  return std::move(collector.text);
} // TextContent

bool HasClass(const Node& n, std::string_view cls) {
  if (!IsElement(n) || cls.empty())
    return false;
  auto attr = n.attribute("class");
  if (!attr)
    return false;
  auto names = std::vector<std::string>{};
  auto value = std::string{attr.value()};
  boost::algorithm::split(names, value, boost::algorithm::is_space(),
                          boost::algorithm::token_compress_on);
  return std::ranges::find(names, cls) != names.end();
} // HasClass

Node FindByAttr(const Node& root, gsl::czstring key, std::string_view value) {
  return root.find_node([key, value](const Node& n) {
    if (!IsElement(n))
      return false;
    auto a = n.attribute(key);
    return a && std::string_view{a.value()} == value;
  });
} // FindByAttr

Node FindByClass(const Node& root, gsl::czstring tag, std::string_view cls) {
  return root.find_node([tag, cls](const Node& n) {
    if (tag && std::string_view{n.name()} != tag)
      return false;
    return HasClass(n, cls);
  });
} // FindByClass

std::vector<Node> FindAllByClass(const Node& root, std::string_view cls) {
  auto collector = ClassCollector{cls};
  auto walk = root;
  walk.traverse(collector);
  return std::move(collector.found);
} // FindAllByClass

Result<std::string> RequireAttr(const Node& n, gsl::czstring key) {
  if (auto a = n.attribute(key); a && a.value()[0] != '\0')
    return std::string{a.value()};
  auto msg = std::string{"missing attribute \""} + key + "\" on <"
           + n.name() + ">";
  return AttributeMiss(std::move(msg), key);
} // RequireAttr

Result<std::string> RequireText(const Node& n) {
  auto text = TextContent(n);
  if (!text.empty())
    return text;
  return AttributeMiss(std::string{"missing text on <"} + n.name() + ">");
} // RequireText

} // nikke_db::html
