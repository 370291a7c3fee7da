/// @file
/// @brief Extract the character listing or character records from locally
///        saved wiki pages. Pages must be well-formed XHTML: void elements
///        closed (<img/>, <meta/>), as pugixml is an XML parser.
/// Usage:
///   nikke_html list  <home.xhtml> [--base URL]
///   nikke_html pages <page.xhtml>... [--date YYYY-MM-DD]
///
/// Conventions:
/// - C++23, almost-always-auto, fs::path, anon ns.
/// - A page that fails extraction is reported on stderr and skipped.
/// - Exceptions only for unusable input (unreadable/unparsable files).

#include "Extract.hpp"

#include "../Catalog.hpp"
#include "../DailyRandom.hpp"

#include <pugixml.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace fs = std::filesystem;

using namespace nikke_db;

struct Options {
  std::string command;
  std::vector<fs::path> files;
  std::string base_url = wiki::BaseUrl;
  std::optional<std::chrono::year_month_day> date;
}; // Options

Options ParseArgs(int argc, char** argv) {
  auto opts = Options{};
  opts.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    const auto arg = std::string_view{argv[i]};
    if (arg == "--base" && i + 1 < argc) {
      opts.base_url = argv[++i];
    } else if (arg == "--date" && i + 1 < argc) {
      opts.date = ParseDate(argv[++i]);
    } else if (arg.starts_with("--")) {
      throw std::runtime_error{"unknown option: " + std::string{arg}};
    } else {
      opts.files.emplace_back(arg);
    }
  }
  if (opts.files.empty())
    throw std::runtime_error{"no input files"};
  return opts;
} // ParseArgs

void ListCommand(const Options& opts) {
  for (const auto& file: opts.files) {
    auto doc = pugi::xml_document{};
    html::LoadDocument(doc, file);
    const auto list = html::ExtractList(doc, std::cerr, opts.base_url);
    std::cout << file.string() << ": " << std::ssize(list) << " entries\n";
    for (const auto& e: list)
      std::cout << "  " << e << '\n';
  }
} // ListCommand

void PagesCommand(const Options& opts) {
  auto catalog = Catalog{};
  for (const auto& file: opts.files) {
    auto doc = pugi::xml_document{};
    html::LoadDocument(doc, file);

    auto image = std::string{};
    if (auto url = html::PageImage(doc))
      image = html::ImageFilename(html::StripRevision(*url));
    else
      std::cerr << "warning: " << file.string() << ": no og:image\n";

    auto rec = html::ExtractCharacter(doc, std::move(image));
    if (!rec) {
      std::cerr << "error: " << file.string() << ": " << rec.error() << '\n';
      continue;
    }
    if (!catalog.add(*rec))
      std::cerr << "warning: " << file.string() << ": duplicate "
                << rec->name << '\n';
  }

  std::cout << "Characters: " << std::ssize(catalog) << '\n';
  for (const auto& c: catalog.characters())
    std::cout << "  " << c << '\n';

  const auto seed = opts.date ? SeedFor(*opts.date) : SeedForToday();
  if (auto pick = Pick(seed, catalog.characters()))
    std::cout << "Daily pick (seed " << seed << "): " << pick->name << '\n';
} // PagesCommand

} // local

// ---------- main ----------

auto main(int argc, char** argv) -> int {
  if (argc < 3) {
    std::cerr << "usage: nikke_html list  <home.xhtml> [--base URL]\n"
                 "       nikke_html pages <page.xhtml>... [--date YYYY-MM-DD]\n"
                 "Pages must be well-formed XHTML (void elements closed: <img/>).\n";
    return EXIT_FAILURE;
  }
  try {
    const auto opts = ParseArgs(argc, argv);
    if (opts.command == "list")
      ListCommand(opts);
    else if (opts.command == "pages")
      PagesCommand(opts);
    else
      throw std::runtime_error{"unknown command: " + opts.command};
    return EXIT_SUCCESS;
  }
  catch (const std::exception& e) {
    std::cerr << "std::exception: " << e.what() << '\n';
  }
  catch (...) {
    std::cerr << "unknown exception\n";
  }
  return EXIT_FAILURE;
} // main
