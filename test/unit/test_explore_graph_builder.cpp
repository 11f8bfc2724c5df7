//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: test_explore_graph_builder.cpp
// Description: Tests for explore parsing, alias relations, unnest detection
//              and merging of per-file scans.
//===----------------------------------------------------------------------===//

#include "explore_graph_builder.hpp"
#include <gtest/gtest.h>

using namespace lookml_lineage;

static SourceFile MakeModelFile(const std::string &path, const std::string &text) {
	SourceFile file;
	file.path = path;
	file.text = text;
	file.category = FileCategory::MODEL;
	file.model_name = "shop";
	return file;
}

static const char *const SHOP_MODEL = R"LKML(
explore: orders {
  join: customers {
    sql_on: ${orders.customer_id} = ${customers.id} ;;
    join: addresses {
      sql_on: ${customers.address_id} = ${addresses.id} ;;
    }
  }
  join: orders__items {
    sql: LEFT JOIN UNNEST(${orders.items}) AS orders__items ;;
  }
}

explore: order_analysis {
  from: order_facts
  join: buyers {
    from: customers
    sql_on: ${order_analysis.buyer_id} = ${buyers.id} ;;
  }
}
)LKML";

TEST(ExploreGraphBuilderTest, ScanCollectsBaseViewsAndNestedJoins) {
	ScanDiagnostics diagnostics;
	auto scan = ScanExplores(MakeModelFile("models/shop.model.lkml", SHOP_MODEL), diagnostics);

	ASSERT_EQ(scan.explores.size(), 2u);
	const auto &orders = scan.explores[0];
	EXPECT_EQ(orders.name, "orders");
	EXPECT_EQ(orders.model_name, "shop");
	EXPECT_EQ(orders.base_view, "orders");
	std::vector<std::string> expected_joins = {"customers", "addresses", "orders__items"};
	EXPECT_EQ(orders.joined_views, expected_joins);

	const auto &analysis = scan.explores[1];
	EXPECT_EQ(analysis.base_view, "order_facts");
	std::vector<std::string> expected_view_set = {"order_facts", "buyers"};
	EXPECT_EQ(analysis.ViewSet(), expected_view_set);
	EXPECT_TRUE(diagnostics.Warnings().empty());
}

TEST(ExploreGraphBuilderTest, ScanRecordsAliasesAndUnnestJoins) {
	ScanDiagnostics diagnostics;
	auto scan = ScanExplores(MakeModelFile("models/shop.model.lkml", SHOP_MODEL), diagnostics);

	ASSERT_EQ(scan.aliases.size(), 2u);
	EXPECT_EQ(scan.aliases[0].alias_view, "order_analysis");
	EXPECT_EQ(scan.aliases[0].base_view, "order_facts");
	EXPECT_EQ(scan.aliases[1].alias_view, "buyers");
	EXPECT_EQ(scan.aliases[1].base_view, "customers");

	std::vector<std::string> expected_unnest = {"orders__items"};
	EXPECT_EQ(scan.unnest_joins, expected_unnest);
}

TEST(ExploreGraphBuilderTest, NestedJoinSqlDoesNotMarkParent) {
	std::string text = "explore: e {\n  join: parent {\n    sql_on: 1 = 1 ;;\n"
	                   "    join: child {\n      sql: CROSS JOIN unnest(${parent.values}) ;;\n    }\n  }\n}\n";
	ScanDiagnostics diagnostics;
	auto scan = ScanExplores(MakeModelFile("models/m.model.lkml", text), diagnostics);
	std::vector<std::string> expected_unnest = {"child"};
	EXPECT_EQ(scan.unnest_joins, expected_unnest);
}

TEST(ExploreGraphBuilderTest, UnnestOnLongSqlLine) {
	std::string long_list;
	for (size_t i = 0; i < 5000; i++) {
		long_list += "${orders.col" + std::to_string(i) + "}, ";
	}
	std::string text = "explore: orders {\n"
	                   "  join: orders__wide {\n    SQL: LEFT JOIN UNNEST([" + long_list + "]) AS w ;;\n  }\n"
	                   "  join: orders__plain {\n    sql_on: unnest(x) ;;\n    sql:\n LEFT JOIN unnest(y) ;;\n  }\n"
	                   "  join: orders__other {\n    sql: LEFT JOIN x ;;\n    type: unnest(z)\n  }\n}\n";
	ScanDiagnostics diagnostics;
	auto scan = ScanExplores(MakeModelFile("models/m.model.lkml", text), diagnostics);
	std::vector<std::string> expected_unnest = {"orders__wide"};
	EXPECT_EQ(scan.unnest_joins, expected_unnest);
	ASSERT_EQ(scan.explores.size(), 1u);
	EXPECT_EQ(scan.explores[0].joined_views.size(), 3u);
}

TEST(ExploreGraphBuilderTest, ViewFilesReportViewsWithOwnSource) {
	SourceFile file;
	file.path = "views/items.view.lkml";
	file.category = FileCategory::VIEW;
	file.text = "view: orders__items {\n  sql_table_name: proj.ds.items ;;\n}\n"
	            "view: orders__tags {\n  dimension: tag {}\n}\n";
	ScanDiagnostics diagnostics;
	auto scan = ScanExplores(file, diagnostics);
	EXPECT_TRUE(scan.explores.empty());
	std::vector<std::string> expected = {"orders__items"};
	EXPECT_EQ(scan.views_with_own_source, expected);
}

TEST(ExploreGraphBuilderTest, MergeKeepsFirstExploreAndFiltersUnnest) {
	ExploreScan first;
	ExploreRecord orders;
	orders.name = "orders";
	orders.base_view = "orders";
	orders.joined_views = {"customers"};
	first.explores.push_back(orders);
	first.aliases.push_back({"buyers", "customers"});
	first.unnest_joins = {"orders__items", "orders__tags"};

	ExploreScan second;
	ExploreRecord redefined = orders;
	redefined.joined_views = {"products"};
	second.explores.push_back(redefined);
	second.aliases.push_back({"buyers", "customers"});
	second.views_with_own_source = {"orders__items"};

	ScanDiagnostics diagnostics;
	ExploreGraph graph = MergeExploreScans({first, second}, diagnostics);

	ASSERT_EQ(graph.explores.size(), 1u);
	std::vector<std::string> expected_joins = {"customers"};
	EXPECT_EQ(graph.explores[0].joined_views, expected_joins);
	EXPECT_EQ(graph.aliases.size(), 1u);
	EXPECT_EQ(graph.unnest_views.count("orders__items"), 0u);
	EXPECT_EQ(graph.unnest_views.count("orders__tags"), 1u);

	EXPECT_EQ(graph.ExploreCount("orders"), 1u);
	EXPECT_EQ(graph.ExploreCount("customers"), 1u);
	EXPECT_EQ(graph.ExploreCount("products"), 0u);
}

TEST(ExploreGraphBuilderTest, CommentedExploresAreIgnored) {
	std::string text = "# explore: retired {\n#   join: legacy {}\n# }\nexplore: live { }\n";
	SourceCorpus corpus;
	corpus.model_files.push_back(MakeModelFile("models/m.model.lkml", text));
	ScanDiagnostics diagnostics;
	ExploreGraph graph = BuildExploreGraph(corpus, diagnostics);
	ASSERT_EQ(graph.explores.size(), 1u);
	EXPECT_EQ(graph.explores[0].name, "live");
	EXPECT_EQ(graph.ExploreCount("legacy"), 0u);
}
