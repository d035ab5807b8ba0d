#include <gtest/gtest.h>

#include "core/metadata/SchemaMapper.hpp"
#include "TestSupport.hpp"

using namespace safs;

TEST(SchemaMapperTest, DescribesQualifiedColumnWithLanguage) {
  SchemaTable table;
  auto d = table.describe("dc.subject.lcsh[en]");
  EXPECT_EQ(d.kind, FieldKind::Metadata);
  EXPECT_EQ(d.schema, "dc");
  EXPECT_EQ(d.element, "subject");
  ASSERT_TRUE(d.qualifier.has_value());
  EXPECT_EQ(*d.qualifier, "lcsh");
  ASSERT_TRUE(d.language.has_value());
  EXPECT_EQ(*d.language, "en");
}

TEST(SchemaMapperTest, UnqualifiedAndFilenameColumns) {
  SchemaTable table;
  auto title = table.describe("dc.title");
  EXPECT_EQ(title.kind, FieldKind::Metadata);
  EXPECT_FALSE(title.qualifier.has_value());
  EXPECT_FALSE(title.language.has_value());
  EXPECT_EQ(table.describe("filename").kind, FieldKind::Filename);
}

TEST(SchemaMapperTest, UnknownColumnsPassThroughAsExtensions) {
  SchemaTable table;
  EXPECT_EQ(table.describe("notes").kind, FieldKind::Extension);
  EXPECT_EQ(table.describe("acme.box").kind, FieldKind::Extension);
  EXPECT_EQ(table.describe("dc.").kind, FieldKind::Extension);
  EXPECT_EQ(table.describe("dcterms.spatial").kind, FieldKind::Metadata);
}

TEST(SchemaMapperTest, DescriptorFileNames) {
  EXPECT_EQ(SchemaTable::descriptorFile("dc"), "dublin_core.xml");
  EXPECT_EQ(SchemaTable::descriptorFile("local"), "metadata_local.xml");
}

TEST(SchemaMapperTest, LoadMetadataReportsRowProblemsWithGlobalIndices) {
  test::TempDir dir;
  auto csv = test::write_file(dir / "m.csv",
                              "filename,dc.title\n"
                              "a.pdf,A\n"
                              ",B\n"
                              "c.pdf,C,extra\n");
  auto sheet = load_metadata(csv, SchemaTable{}, 10);
  EXPECT_EQ(sheet.rowCount, 3u);
  ASSERT_EQ(sheet.rows.size(), 1u);
  EXPECT_EQ(sheet.rows[0].rowIndex, 10u);
  ASSERT_EQ(sheet.problems.size(), 2u);
  EXPECT_EQ(sheet.problems[0].rowIndex, std::optional<size_t>(11));
  EXPECT_EQ(sheet.problems[0].reason, "empty filename field");
  EXPECT_EQ(sheet.problems[1].rowIndex, std::optional<size_t>(12));
  EXPECT_EQ(sheet.problems[1].reason, "has 3 columns, expected 2");
}

TEST(SchemaMapperTest, MissingFilenameColumnFlagsHeaderAndEveryRow) {
  test::TempDir dir;
  auto csv = test::write_file(dir / "m.csv", "dc.title\nA\nB\n");
  auto sheet = load_metadata(csv, SchemaTable{});
  EXPECT_TRUE(sheet.rows.empty());
  ASSERT_EQ(sheet.problems.size(), 3u);
  EXPECT_FALSE(sheet.problems[0].rowIndex.has_value());
}

TEST(SchemaMapperTest, MapRowSkipsFilenameAndEmptyValues) {
  SchemaTable table;
  std::vector<FieldDescriptor> cols {table.describe("filename"), table.describe("dc.title"),
                                     table.describe("dc.date.issued"), table.describe("box")};
  MetadataRow row;
  row.values = {{"filename", "a.pdf"}, {"dc.title", "T"}, {"dc.date.issued", ""}, {"box", "7"}};
  auto mapped = map_row(row, cols);
  ASSERT_EQ(mapped.size(), 2u);
  EXPECT_EQ(mapped[0].descriptor.element, "title");
  EXPECT_EQ(mapped[1].descriptor.kind, FieldKind::Extension);
  EXPECT_EQ(mapped[1].value, "7");
}
