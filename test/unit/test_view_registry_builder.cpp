//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: test_view_registry_builder.cpp
// Description: Tests for view declaration scanning and registration.
//===----------------------------------------------------------------------===//

#include "view_registry_builder.hpp"
#include "block_scanner.hpp"
#include <gtest/gtest.h>

using namespace lookml_lineage;

static SourceFile MakeFile(const std::string &path, const std::string &text, FileCategory category) {
	SourceFile file;
	file.path = path;
	file.text = text;
	file.category = category;
	return file;
}

//===--------------------------------------------------------------------===//
// Declarations
//===--------------------------------------------------------------------===//

TEST(ViewRegistryBuilderTest, ViewFilesContributeHeaders) {
	auto file = MakeFile("views/a.view.lkml", "view: alpha {\n}\n# view: hidden {}\nview: beta { }\n",
	                     FileCategory::VIEW);
	ScanDiagnostics diagnostics;
	auto declarations = ScanViewDeclarations(file, diagnostics);
	ASSERT_EQ(declarations.size(), 2u);
	EXPECT_EQ(declarations[0].name, "alpha");
	EXPECT_EQ(declarations[0].site, ViewDeclaration::Site::VIEW_HEADER);
	EXPECT_EQ(declarations[1].name, "beta");
}

TEST(ViewRegistryBuilderTest, OverlongNamesAreSkipped) {
	std::string long_name(MAX_VIEW_NAME_LENGTH + 1, 'x');
	auto file = MakeFile("views/long.view.lkml", "view: " + long_name + " { }\nview: ok { }", FileCategory::VIEW);
	ScanDiagnostics diagnostics;
	auto declarations = ScanViewDeclarations(file, diagnostics);
	ASSERT_EQ(declarations.size(), 1u);
	EXPECT_EQ(declarations[0].name, "ok");
}

TEST(ViewRegistryBuilderTest, ModelFilesContributeExploreAndJoinSites) {
	auto file = MakeFile("models/m.model.lkml",
	                     "explore: analysis {\n  from: facts\n  join: dims { sql_on: 1 = 1 ;; }\n"
	                     "  join: dims_again { from: dims }\n}\n"
	                     "explore: plain { join: plain { from: plain } }\n",
	                     FileCategory::MODEL);
	ScanDiagnostics diagnostics;
	auto declarations = ScanViewDeclarations(file, diagnostics);
	ASSERT_EQ(declarations.size(), 4u);
	EXPECT_EQ(declarations[0].site, ViewDeclaration::Site::EXPLORE);
	EXPECT_EQ(declarations[0].name, "analysis");
	EXPECT_EQ(declarations[0].from_target, "facts");
	EXPECT_EQ(declarations[1].name, "dims");
	EXPECT_EQ(declarations[1].from_target, "");
	EXPECT_EQ(declarations[2].name, "dims_again");
	EXPECT_EQ(declarations[2].from_target, "dims");
	// `from:` equal to the own name is not an alias
	EXPECT_EQ(declarations[3].name, "plain");
	EXPECT_EQ(declarations[3].from_target, "");
}

TEST(ViewRegistryBuilderTest, JoinsNestedAtAnyDepthAreDeclared) {
	auto file = MakeFile("models/m.model.lkml",
	                     "explore: a {\n"
	                     "  join: b {\n    sql_on: ${a.id} = ${b.id} ;;\n"
	                     "    join: c {\n      join: d { from: e }\n    }\n  }\n"
	                     "  join: f { }\n}\n",
	                     FileCategory::MODEL);
	ScanDiagnostics diagnostics;
	auto declarations = ScanViewDeclarations(file, diagnostics);
	ASSERT_EQ(declarations.size(), 4u);
	EXPECT_EQ(declarations[0].name, "b");
	EXPECT_EQ(declarations[0].from_target, "");
	EXPECT_EQ(declarations[1].name, "c");
	EXPECT_EQ(declarations[1].from_target, "");
	EXPECT_EQ(declarations[2].name, "d");
	EXPECT_EQ(declarations[2].from_target, "e");
	EXPECT_EQ(declarations[3].name, "f");

	ViewRegistry registry;
	RegisterViewDeclarations(registry, file, declarations);
	const ViewRecord *d = registry.Find("d");
	ASSERT_NE(d, nullptr);
	EXPECT_EQ(d->citation_type, CitationType::DERIVED_FROM);
	EXPECT_EQ(d->derived_from, "e");
	EXPECT_NE(registry.Find("c"), nullptr);
}

TEST(ViewRegistryBuilderTest, LongJoinBodyWithoutBraces) {
	std::string sql_on = "    sql_on:";
	for (size_t i = 0; i < 6000; i++) {
		sql_on += " a.c" + std::to_string(i) + " = b.c" + std::to_string(i) + " AND";
	}
	auto file = MakeFile("models/m.model.lkml",
	                     "explore: a {\n  join: wide {\n    from: base\n" + sql_on + " TRUE ;;\n  }\n}\n",
	                     FileCategory::MODEL);
	ScanDiagnostics diagnostics;
	auto declarations = ScanViewDeclarations(file, diagnostics);
	ASSERT_EQ(declarations.size(), 1u);
	EXPECT_EQ(declarations[0].name, "wide");
	EXPECT_EQ(declarations[0].from_target, "base");
}

TEST(ViewRegistryBuilderTest, UnterminatedExploreIsLeftToTheExploreGraph) {
	auto file = MakeFile("models/m.model.lkml",
	                     "explore: broken {\n  join: lost { }\n\nexplore: fine {\n  join: kept { }\n}\n",
	                     FileCategory::MODEL);
	ScanDiagnostics diagnostics;
	auto declarations = ScanViewDeclarations(file, diagnostics);
	ASSERT_EQ(declarations.size(), 1u);
	EXPECT_EQ(declarations[0].name, "kept");
	EXPECT_TRUE(diagnostics.Warnings().empty());
}

//===--------------------------------------------------------------------===//
// Registration
//===--------------------------------------------------------------------===//

TEST(ViewRegistryBuilderTest, BuildRegistryKeepsDeclarationOrderAndFirstFile) {
	SourceCorpus corpus;
	corpus.view_files.push_back(MakeFile("views/orders.view.lkml", "view: orders { }", FileCategory::VIEW));
	corpus.view_files.push_back(MakeFile("views/dup.view.lkml", "view: orders { }", FileCategory::VIEW));
	corpus.model_files.push_back(MakeFile("models/m.model.lkml",
	                                      "explore: orders {\n  join: buyers { from: customers }\n"
	                                      "  join: orders { }\n}\n"
	                                      "explore: order_summary { from: orders }\n",
	                                      FileCategory::MODEL));

	ScanDiagnostics diagnostics;
	ViewRegistry registry = BuildViewRegistry(corpus, diagnostics);
	ASSERT_EQ(registry.Size(), 3u);
	EXPECT_EQ(registry.Views()[0].name, "orders");
	EXPECT_EQ(registry.Views()[1].name, "buyers");
	EXPECT_EQ(registry.Views()[2].name, "order_summary");

	const ViewRecord *orders = registry.Find("orders");
	ASSERT_NE(orders, nullptr);
	EXPECT_EQ(orders->source_file, "views/orders.view.lkml");
	EXPECT_EQ(orders->citation_type, CitationType::NATIVE);

	const ViewRecord *buyers = registry.Find("buyers");
	ASSERT_NE(buyers, nullptr);
	EXPECT_EQ(buyers->citation_type, CitationType::DERIVED_FROM);
	EXPECT_EQ(buyers->derived_from, "customers");
	EXPECT_EQ(buyers->source_file, "models/m.model.lkml");

	const ViewRecord *summary = registry.Find("order_summary");
	ASSERT_NE(summary, nullptr);
	EXPECT_EQ(summary->citation_type, CitationType::DERIVED_FROM);
	EXPECT_EQ(summary->derived_from, "orders");
}

TEST(ViewRegistryBuilderTest, ExploreSiteDoesNotOverrideExistingView) {
	ViewRegistry registry;
	auto view_file = MakeFile("views/summary.view.lkml", "view: summary { }", FileCategory::VIEW);
	ScanDiagnostics diagnostics;
	RegisterViewDeclarations(registry, view_file, ScanViewDeclarations(view_file, diagnostics));

	auto model_file = MakeFile("models/m.model.lkml", "explore: summary { from: orders }", FileCategory::MODEL);
	RegisterViewDeclarations(registry, model_file, ScanViewDeclarations(model_file, diagnostics));

	const ViewRecord *summary = registry.Find("summary");
	ASSERT_NE(summary, nullptr);
	EXPECT_EQ(summary->citation_type, CitationType::NATIVE);
	EXPECT_TRUE(summary->derived_from.empty());
	EXPECT_EQ(registry.Size(), 1u);
}

TEST(ViewRegistryBuilderTest, JoinFromDoesNotMakeExploreAnAlias) {
	auto file = MakeFile("models/m.model.lkml", "explore: orders {\n  join: buyers { from: customers }\n}\n",
	                     FileCategory::MODEL);
	ScanDiagnostics diagnostics;
	auto declarations = ScanViewDeclarations(file, diagnostics);
	ASSERT_EQ(declarations.size(), 1u);
	EXPECT_EQ(declarations[0].site, ViewDeclaration::Site::JOIN);
	EXPECT_EQ(declarations[0].name, "buyers");
}
