//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: test_alias_resolver.cpp
// Description: Tests for alias chains, cycles and table copying.
//===----------------------------------------------------------------------===//

#include "alias_resolver.hpp"
#include <gtest/gtest.h>

using namespace lookml_lineage;

static ViewRegistry MakeRegistry() {
	ViewRegistry registry;
	auto &orders = registry.GetOrAdd("orders");
	orders.primary_table = "proj.sales.orders";
	orders.additional_tables = {"proj.sales.order_items"};
	registry.GetOrAdd("empty_base");
	return registry;
}

TEST(AliasResolverTest, FollowAliasChain) {
	std::vector<AliasRelation> aliases = {{"a", "b"}, {"b", "c"}};
	EXPECT_EQ(FollowAliasChain("a", aliases), "c");
	EXPECT_EQ(FollowAliasChain("b", aliases), "c");
	EXPECT_EQ(FollowAliasChain("c", aliases), "c");
}

TEST(AliasResolverTest, FollowAliasChainDetectsCycles) {
	std::vector<AliasRelation> aliases = {{"a", "b"}, {"b", "a"}};
	EXPECT_EQ(FollowAliasChain("a", aliases), "");
	std::vector<AliasRelation> self = {{"x", "x"}};
	EXPECT_EQ(FollowAliasChain("x", self), "");
}

TEST(AliasResolverTest, AliasCopiesBaseTables) {
	ViewRegistry input = MakeRegistry();
	ViewRegistry result = ResolveAliases(input, {{"recent_orders", "orders"}});

	const ViewRecord *alias = result.Find("recent_orders");
	ASSERT_NE(alias, nullptr);
	EXPECT_EQ(alias->citation_type, CitationType::DERIVED_FROM);
	EXPECT_EQ(alias->derived_from, "orders");
	EXPECT_EQ(alias->primary_table, "proj.sales.orders");
	std::vector<std::string> expected = {"proj.sales.order_items"};
	EXPECT_EQ(alias->additional_tables, expected);

	// The input snapshot is untouched
	EXPECT_FALSE(input.Contains("recent_orders"));
}

TEST(AliasResolverTest, CopiedTablesAreIndependent) {
	ViewRegistry input = MakeRegistry();
	ViewRegistry result = ResolveAliases(input, {{"recent_orders", "orders"}});
	result.Find("orders")->additional_tables.push_back("proj.sales.refunds");
	EXPECT_EQ(result.Find("recent_orders")->additional_tables.size(), 1u);
}

TEST(AliasResolverTest, ChainResolvesToUltimateBase) {
	ViewRegistry input = MakeRegistry();
	ViewRegistry result = ResolveAliases(input, {{"a", "b"}, {"b", "orders"}});
	EXPECT_EQ(result.Find("a")->derived_from, "b");
	EXPECT_EQ(result.Find("a")->primary_table, "proj.sales.orders");
	EXPECT_EQ(result.Find("b")->primary_table, "proj.sales.orders");
}

TEST(AliasResolverTest, MissingTablelessAndCyclicBasesGiveEmptyTables) {
	ViewRegistry input = MakeRegistry();
	ViewRegistry result =
	    ResolveAliases(input, {{"ghost_alias", "ghost"}, {"hollow", "empty_base"}, {"p", "q"}, {"q", "p"}});
	EXPECT_FALSE(result.Find("ghost_alias")->HasTables());
	EXPECT_FALSE(result.Find("hollow")->HasTables());
	EXPECT_FALSE(result.Find("p")->HasTables());
	EXPECT_FALSE(result.Find("q")->HasTables());
	EXPECT_EQ(result.Find("p")->citation_type, CitationType::DERIVED_FROM);
}

TEST(AliasResolverTest, FirstDeclarationOfAnAliasWins) {
	ViewRegistry input = MakeRegistry();
	ViewRegistry result = ResolveAliases(input, {{"x", "orders"}, {"x", "empty_base"}});
	EXPECT_EQ(result.Find("x")->derived_from, "orders");
	EXPECT_EQ(result.Find("x")->primary_table, "proj.sales.orders");
}
