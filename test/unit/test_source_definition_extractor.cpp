//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: test_source_definition_extractor.cpp
// Description: Tests for sql_table_name, derived SQL and explore_source clauses.
//===----------------------------------------------------------------------===//

#include "source_definition_extractor.hpp"
#include <gtest/gtest.h>

using namespace lookml_lineage;

static SourceDefinition Extract(const std::string &body) {
	ScanDiagnostics diagnostics;
	return ExtractSourceDefinition(body, "test.view.lkml", diagnostics);
}

TEST(SourceDefinitionExtractorTest, SqlTableNameUpToTerminator) {
	auto definition = Extract("\n  sql_table_name: `proj`.`ds`.`orders` ;;\n  dimension: id {}\n");
	EXPECT_EQ(definition.kind, SourceKind::SQL_TABLE_NAME);
	EXPECT_EQ(definition.text, "`proj`.`ds`.`orders`");
}

TEST(SourceDefinitionExtractorTest, SqlTableNameWithoutTerminatorEndsAtLine) {
	auto definition = Extract("\n  sql_table_name: proj.ds.orders\n  dimension: id {}\n");
	EXPECT_EQ(definition.kind, SourceKind::SQL_TABLE_NAME);
	EXPECT_EQ(definition.text, "proj.ds.orders");
}

TEST(SourceDefinitionExtractorTest, SqlTableNameKeepsTemplatedText) {
	auto definition = Extract("sql_table_name: {% if x %} proj.ds.a {% else %} proj.ds.b {% endif %} ;;");
	EXPECT_EQ(definition.kind, SourceKind::SQL_TABLE_NAME);
	EXPECT_EQ(definition.text, "{% if x %} proj.ds.a {% else %} proj.ds.b {% endif %}");
}

TEST(SourceDefinitionExtractorTest, ExploreSource) {
	auto definition = Extract("derived_table: {\n explore_source: orders {\n column: id { field: orders.id }\n }\n}");
	EXPECT_EQ(definition.kind, SourceKind::EXPLORE_SOURCE);
	EXPECT_EQ(definition.text, "orders");
}

TEST(SourceDefinitionExtractorTest, DerivedSqlForms) {
	auto terminated = Extract("derived_table: {\n sql: SELECT * FROM proj.ds.a ;;\n}");
	EXPECT_EQ(terminated.kind, SourceKind::DERIVED_SQL);
	EXPECT_EQ(terminated.text, "SELECT * FROM proj.ds.a");

	auto triple_brace = Extract("derived_table: {\n sql: {{{ SELECT 1 FROM proj.ds.b }}}\n}");
	EXPECT_EQ(triple_brace.kind, SourceKind::DERIVED_SQL);
	EXPECT_EQ(triple_brace.text, "SELECT 1 FROM proj.ds.b");

	auto triple_quote = Extract("derived_table: {\n sql: \"\"\"SELECT 2 FROM proj.ds.c\"\"\"\n}");
	EXPECT_EQ(triple_quote.kind, SourceKind::DERIVED_SQL);
	EXPECT_EQ(triple_quote.text, "SELECT 2 FROM proj.ds.c");

	auto braced = Extract("derived_table: {\n sql: { SELECT 3 FROM proj.ds.d }\n}");
	EXPECT_EQ(braced.kind, SourceKind::DERIVED_SQL);
	EXPECT_EQ(braced.text, "SELECT 3 FROM proj.ds.d");

	auto quoted = Extract("derived_table: {\n sql: \"SELECT 4 FROM proj.ds.e\"\n}");
	EXPECT_EQ(quoted.kind, SourceKind::DERIVED_SQL);
	EXPECT_EQ(quoted.text, "SELECT 4 FROM proj.ds.e");
}

TEST(SourceDefinitionExtractorTest, SqlTableNameTakesPrecedence) {
	auto definition = Extract("sql_table_name: proj.ds.a ;;\nderived_table: { sql: SELECT 1 ;; }");
	EXPECT_EQ(definition.kind, SourceKind::SQL_TABLE_NAME);
}

TEST(SourceDefinitionExtractorTest, NoDefinition) {
	auto definition = Extract("\n  dimension: id { sql: ${TABLE}.id ;; }\n");
	EXPECT_EQ(definition.kind, SourceKind::UNKNOWN);
	EXPECT_TRUE(definition.text.empty());
}

TEST(SourceDefinitionExtractorTest, UnterminatedDerivedTableWarns) {
	ScanDiagnostics diagnostics;
	auto definition = ExtractSourceDefinition("derived_table: {\n sql: SELECT 1 ;;\n", "x.view.lkml", diagnostics);
	EXPECT_EQ(definition.kind, SourceKind::UNKNOWN);
	ASSERT_EQ(diagnostics.Count(ScanWarningKind::BLOCK_UNTERMINATED), 1u);
	EXPECT_EQ(diagnostics.Warnings()[0].subject, "derived_table");
}

TEST(SourceDefinitionExtractorTest, ScanAndApplyFirstDefinitionWins) {
	SourceFile first;
	first.path = "views/a.view.lkml";
	first.text = "view: orders {\n  sql_table_name: proj.ds.orders ;;\n}\n"
	             "# view: hidden { sql_table_name: proj.ds.hidden ;; }\n";
	SourceFile second;
	second.path = "views/b.view.lkml";
	second.text = "view: orders {\n  sql_table_name: proj.ds.other ;;\n}\nview: extra { }\n";

	ScanDiagnostics diagnostics;
	auto first_definitions = ScanSourceDefinitions(first, diagnostics);
	ASSERT_EQ(first_definitions.size(), 1u);
	auto second_definitions = ScanSourceDefinitions(second, diagnostics);
	ASSERT_EQ(second_definitions.size(), 2u);

	ViewRegistry registry;
	registry.GetOrAdd("orders");
	ViewRegistry result = ApplySourceDefinitions(registry, {first_definitions, second_definitions});

	EXPECT_EQ(result.Find("orders")->source.text, "proj.ds.orders");
	ASSERT_NE(result.Find("extra"), nullptr);
	EXPECT_EQ(result.Find("extra")->source.kind, SourceKind::UNKNOWN);
	EXPECT_EQ(registry.Find("orders")->source.kind, SourceKind::UNKNOWN);
}
