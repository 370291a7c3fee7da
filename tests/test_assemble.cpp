#include <gtest/gtest.h>
#include "Assemble.hpp"

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace nikke_db;

namespace {

struct Record {
  std::string name;
  int level;
  std::optional<std::string> note;
  bool operator==(const Record&) const = default;
}; // Record

Result<std::string> GoodName()  { return std::string{"Rapi"}; }
Result<int>         GoodLevel() { return 160; }
Result<std::optional<std::string>> NoNote() { return std::nullopt; }

Result<std::string> BadName()  { return StructuralMiss("no title", "v$"); }
Result<int>         BadLevel() { return ParseMiss("unknown level 'x'", "x"); }

} // local

// ============================================================================
// Success
// ============================================================================

TEST(AssembleTest, AllOkBuildsRecordInOrder) {
  auto r = Assemble<Record>(Field{"name",  GoodName()},
                            Field{"level", GoodLevel()},
                            Field{"note",  NoNote()});
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, (Record{"Rapi", 160, std::nullopt}));
}

TEST(AssembleTest, PlainValuesAreOk) {
  auto r = Assemble<Record>(Field{"name",  std::string{"Anis"}},
                            Field{"level", 1},
                            Field{"note",  std::optional<std::string>{"x"}});
  ASSERT_TRUE(r);
  EXPECT_EQ(r->name, "Anis");
  EXPECT_EQ(r->note, std::optional<std::string>{"x"});
}

TEST(AssembleTest, SameOkInputsSameRecord) {
  auto once = [] {
    return Assemble<Record>(Field{"name",  GoodName()},
                            Field{"level", GoodLevel()},
                            Field{"note",  NoNote()});
  };
  const auto first  = once();
  const auto second = once();
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(*first, *second);
}

TEST(AssembleTest, SameFailingInputsSameReport) {
  auto once = [] {
    return Assemble<Record>(Field{"name",  BadName()},
                            Field{"level", GoodLevel()},
                            Field{"note",  NoNote()});
  };
  EXPECT_EQ(once(), once());
}

// ============================================================================
// Failure
// ============================================================================

TEST(AssembleTest, ReportHoldsExactlyTheFailedFields) {
  auto r = Assemble<Record>(Field{"name",  BadName()},
                            Field{"level", BadLevel()},
                            Field{"note",  NoNote()});
  ASSERT_FALSE(r);
  const auto& report = r.error();
  EXPECT_EQ(report.size(), 2u);
  EXPECT_EQ(report.fields(), (std::vector<std::string>{"name", "level"}));
  EXPECT_FALSE(report.contains("note"));
  EXPECT_EQ(report.at("name").kind,  ErrorKind::StructuralMiss);
  EXPECT_EQ(report.at("level").kind, ErrorKind::ParseMiss);
  EXPECT_EQ(report.at("level").context, "x");
}

TEST(AssembleTest, SingleFailureIsEnough) {
  auto r = Assemble<Record>(Field{"name",  GoodName()},
                            Field{"level", BadLevel()},
                            Field{"note",  NoNote()});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().fields(), std::vector<std::string>{"level"});
}

TEST(AssembleTest, ReportPrintsEachField) {
  auto r = Assemble<Record>(Field{"name",  BadName()},
                            Field{"level", BadLevel()},
                            Field{"note",  NoNote()});
  ASSERT_FALSE(r);
  auto os = std::ostringstream{};
  os << r.error();
  EXPECT_EQ(os.str(), "name: no title; level: unknown level 'x'");
}

// ============================================================================
// ErrorReport
// ============================================================================

TEST(ErrorReportTest, AddReplacesSameField) {
  auto report = ErrorReport{};
  EXPECT_TRUE(report.empty());
  report.add("squad", Error{ErrorKind::StructuralMiss, "first", ""});
  report.add("squad", Error{ErrorKind::AttributeMiss,  "second", ""});
  EXPECT_EQ(report.size(), 1u);
  EXPECT_EQ(report.at("squad").message, "second");
}

TEST(ErrorReportTest, LookupOfUnknownField) {
  auto report = ErrorReport{};
  report.add("code", Error{ErrorKind::ParseMiss, "unknown element code 'x'", "x"});
  EXPECT_EQ(report.find("burst"), nullptr);
  EXPECT_THROW(report.at("burst"), std::out_of_range);
}
