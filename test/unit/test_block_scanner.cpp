//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: test_block_scanner.cpp
// Description: Tests for brace matching, block discovery and comment stripping.
//===----------------------------------------------------------------------===//

#include "block_scanner.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace lookml_lineage;

//===--------------------------------------------------------------------===//
// FindBlockEnd
//===--------------------------------------------------------------------===//

TEST(BlockScannerTest, FindBlockEndMatchesNestedBraces) {
	std::string text = "x { a { b } c { d { e } } } tail";
	size_t open = text.find('{');
	size_t close = FindBlockEnd(text, open);
	ASSERT_NE(close, std::string::npos);
	EXPECT_EQ(text.substr(close + 1), " tail");
}

TEST(BlockScannerTest, FindBlockEndReturnsNposWhenUnbalanced) {
	std::string text = "view: a { dimension: b { sql: x ;;";
	EXPECT_EQ(FindBlockEnd(text, text.find('{')), std::string::npos);
}

TEST(BlockScannerTest, FindBlockEndRespectsLimit) {
	std::string text = "{ a } { b }";
	EXPECT_EQ(FindBlockEnd(text, 0, 3), std::string::npos);
	EXPECT_EQ(FindBlockEnd(text, 0, 5), 4u);
}

TEST(BlockScannerTest, FindBlockEndRejectsNonBrace) {
	EXPECT_EQ(FindBlockEnd("abc", 0), std::string::npos);
	EXPECT_EQ(FindBlockEnd("abc", 10), std::string::npos);
}

//===--------------------------------------------------------------------===//
// FindBlocks
//===--------------------------------------------------------------------===//

TEST(BlockScannerTest, FindBlocksReturnsTopLevelBlocksInOrder) {
	std::string text = "explore: a {\n  join: b {\n    join: c { }\n  }\n}\n"
	                   "explore: d { }\n";
	ScanDiagnostics diagnostics;
	auto explores = FindBlocks(text, "explore", "model.lkml", diagnostics);
	ASSERT_EQ(explores.size(), 2u);
	EXPECT_EQ(explores[0].name, "a");
	EXPECT_EQ(explores[1].name, "d");
	EXPECT_TRUE(diagnostics.Warnings().empty());

	// Nested joins are found only by re-scanning the parent's body span
	auto joins = FindBlocks(text, "join", explores[0].BodyBegin(), explores[0].BodyEnd(), "model.lkml", diagnostics);
	ASSERT_EQ(joins.size(), 1u);
	EXPECT_EQ(joins[0].name, "b");
	auto nested = FindBlocks(text, "join", joins[0].BodyBegin(), joins[0].BodyEnd(), "model.lkml", diagnostics);
	ASSERT_EQ(nested.size(), 1u);
	EXPECT_EQ(nested[0].name, "c");
}

TEST(BlockScannerTest, FindBlocksBodyExcludesBraces) {
	std::string text = "view: orders { sql_table_name: a.b ;; }";
	ScanDiagnostics diagnostics;
	auto views = FindBlocks(text, "view", "orders.view.lkml", diagnostics);
	ASSERT_EQ(views.size(), 1u);
	EXPECT_EQ(views[0].Body(text), " sql_table_name: a.b ;; ");
	EXPECT_EQ(views[0].header_start, 0u);
}

TEST(BlockScannerTest, FindBlocksWarnsOnUnterminatedBlock) {
	std::string text = "view: good { }\nview: bad {\n  dimension: x {\n";
	ScanDiagnostics diagnostics;
	auto views = FindBlocks(text, "view", "bad.view.lkml", diagnostics);
	ASSERT_EQ(views.size(), 1u);
	EXPECT_EQ(views[0].name, "good");
	ASSERT_EQ(diagnostics.Count(ScanWarningKind::BLOCK_UNTERMINATED), 1u);
	EXPECT_EQ(diagnostics.Warnings()[0].path, "bad.view.lkml");
	EXPECT_EQ(diagnostics.Warnings()[0].subject, "bad");
}

TEST(BlockScannerTest, FindBlocksIgnoresLongerKeywords) {
	std::string text = "derived_table: { explore_source: orders { column: id {} } }";
	ScanDiagnostics diagnostics;
	EXPECT_TRUE(FindBlocks(text, "explore", "x.view.lkml", diagnostics).empty());
}

//===--------------------------------------------------------------------===//
// Properties and Comments
//===--------------------------------------------------------------------===//

TEST(BlockScannerTest, FindIdentifierPropertyReturnsFirstMatch) {
	EXPECT_EQ(FindIdentifierProperty("  from: customers\n  from: other", "from"), "customers");
	EXPECT_EQ(FindIdentifierProperty("sql_on: a = b ;;", "from"), "");
	EXPECT_EQ(FindIdentifierProperty("explore_source: orders {", "explore_source"), "orders");
}

TEST(BlockScannerTest, StripCommentLinesPreservesOffsets) {
	std::string text = "view: a {\n  # join: hidden {}\n  sql: x # not a comment line ;;\n}";
	std::string stripped = StripCommentLines(text);
	ASSERT_EQ(stripped.size(), text.size());
	EXPECT_EQ(stripped.find("hidden"), std::string::npos);
	EXPECT_NE(stripped.find("# not a comment line"), std::string::npos);
	EXPECT_EQ(std::count(stripped.begin(), stripped.end(), '\n'), std::count(text.begin(), text.end(), '\n'));
}

TEST(BlockScannerTest, OwnBodyBlanksNestedBlocks) {
	std::string text = "explore: a {\n  from: base\n  join: b { from: other }\n}";
	ScanDiagnostics diagnostics;
	auto explores = FindBlocks(text, "explore", "model.lkml", diagnostics);
	ASSERT_EQ(explores.size(), 1u);
	std::string own = OwnBody(text, explores[0], "join");
	EXPECT_EQ(own.size(), explores[0].Body(text).size());
	EXPECT_EQ(own.find("other"), std::string::npos);
	EXPECT_EQ(FindIdentifierProperty(own, "from"), "base");
}
