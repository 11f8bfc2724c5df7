//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: test_lineage_event_builder.cpp
// Description: Tests for the OpenLineage event builder and its utilities.
//===----------------------------------------------------------------------===//

#include "lineage_event_builder.hpp"
#include "lineage_utils.hpp"
#include <gtest/gtest.h>
#include <regex>
#include <stdexcept>

using namespace lookml_lineage;

//===--------------------------------------------------------------------===//
// Utilities
//===--------------------------------------------------------------------===//

TEST(LineageUtilsTest, CalculateSHA256) {
	EXPECT_EQ(CalculateSHA256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
	EXPECT_EQ(CalculateSHA256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(LineageUtilsTest, GenerateUUIDIsVersion7) {
	static const std::regex uuid_pattern("^[0-9a-f]{8}-[0-9a-f]{4}-7[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
	std::string first = GenerateUUID();
	std::string second = GenerateUUID();
	EXPECT_TRUE(std::regex_match(first, uuid_pattern)) << first;
	EXPECT_TRUE(std::regex_match(second, uuid_pattern)) << second;
	EXPECT_NE(first, second);
}

TEST(LineageUtilsTest, GetCurrentISOTime) {
	std::string now = GetCurrentISOTime();
	ASSERT_GE(now.size(), 20u);
	EXPECT_EQ(now[10], 'T');
	EXPECT_EQ(now.back(), 'Z');
}

TEST(LineageUtilsTest, SanitizeJobNamePart) {
	EXPECT_EQ(SanitizeJobNamePart("order facts.v2"), "order_facts_v2");
	EXPECT_EQ(SanitizeJobNamePart("__a--b__"), "a_b");
	EXPECT_EQ(SanitizeJobNamePart("$$$"), "");
}

TEST(LineageUtilsTest, GenerateViewJobName) {
	std::string hash = CalculateSHA256("SELECT 1").substr(0, 8);
	EXPECT_EQ(GenerateViewJobName("order_facts", "SELECT 1"), "VIEW_order_facts_" + hash);

	// Without a definition the view name is hashed
	std::string name_hash = CalculateSHA256("orders").substr(0, 8);
	EXPECT_EQ(GenerateViewJobName("orders", ""), "VIEW_orders_" + name_hash);

	std::string long_name(100, 'a');
	std::string job_name = GenerateViewJobName(long_name, "");
	EXPECT_EQ(job_name.size(), 64u);
	EXPECT_EQ(job_name.substr(0, 5), "VIEW_");
}

//===--------------------------------------------------------------------===//
// Event Builder
//===--------------------------------------------------------------------===//

TEST(LineageEventBuilderTest, BuildRequiresRunTimeAndJob) {
	auto missing_job = LineageEventBuilder::CreateComplete().WithRunId("r").WithEventTime("t");
	EXPECT_THROW(missing_job.Build(), std::runtime_error);

	auto missing_time = LineageEventBuilder::CreateComplete().WithRunId("r").WithJob("ns", "job");
	EXPECT_THROW(missing_time.BuildString(), std::runtime_error);

	auto missing_run = LineageEventBuilder::CreateComplete().WithEventTime("t").WithJob("ns", "job");
	EXPECT_THROW(missing_run.Build(), std::runtime_error);
}

TEST(LineageEventBuilderTest, CompleteEventStructure) {
	auto event = LineageEventBuilder::CreateComplete()
	                 .WithRunId("run-1")
	                 .WithEventTime("2024-01-01T00:00:00Z")
	                 .AddJobFacet_JobType("VIEW")
	                 .WithJob("lookml", "VIEW_orders_00000000")
	                 .AddJobFacet_Sql("SELECT 1")
	                 .AddInputDataset("bigquery", "proj.ds.orders")
	                 .AddInputDatasetFacet_DatasetType("bigquery", "proj.ds.orders", "TABLE")
	                 .AddOutputDataset("lookml", "orders")
	                 .AddOutputDatasetFacet_DatasetType("lookml", "orders", "VIEW", "native")
	                 .Build();

	EXPECT_EQ(event["eventType"], "COMPLETE");
	EXPECT_EQ(event["run"]["runId"], "run-1");
	EXPECT_EQ(event["eventTime"], "2024-01-01T00:00:00Z");
	EXPECT_EQ(event["job"]["namespace"], "lookml");
	EXPECT_EQ(event["job"]["name"], "VIEW_orders_00000000");
	// Facets added before WithJob survive it
	EXPECT_EQ(event["job"]["facets"]["jobType"]["jobType"], "VIEW");
	EXPECT_EQ(event["job"]["facets"]["jobType"]["integration"], "LOOKML");
	EXPECT_EQ(event["job"]["facets"]["jobType"]["processingType"], "BATCH");
	EXPECT_EQ(event["job"]["facets"]["sql"]["query"], "SELECT 1");

	ASSERT_EQ(event["inputs"].size(), 1u);
	EXPECT_EQ(event["inputs"][0]["namespace"], "bigquery");
	EXPECT_EQ(event["inputs"][0]["facets"]["datasetType"]["datasetType"], "TABLE");
	EXPECT_FALSE(event["inputs"][0]["facets"]["datasetType"].contains("subType"));

	ASSERT_EQ(event["outputs"].size(), 1u);
	EXPECT_EQ(event["outputs"][0]["facets"]["datasetType"]["subType"], "native");
	EXPECT_TRUE(event["producer"].is_string());
	EXPECT_TRUE(event["schemaURL"].is_string());
}

TEST(LineageEventBuilderTest, FacetsForUnknownDatasetsAreIgnored) {
	auto event = LineageEventBuilder::CreateComplete()
	                 .WithRunId("r")
	                 .WithEventTime("t")
	                 .WithJob("ns", "job")
	                 .AddOutputDataset("lookml", "orders")
	                 .AddOutputDatasetFacet_DatasetType("lookml", "missing", "VIEW")
	                 .AddInputDatasetFacet_DatasetType("bigquery", "missing", "TABLE")
	                 .Build();
	EXPECT_FALSE(event["outputs"][0].contains("facets"));
	EXPECT_FALSE(event.contains("inputs"));
}

TEST(LineageEventBuilderTest, SymlinksAppendIdentifiers) {
	auto event = LineageEventBuilder::CreateComplete()
	                 .WithRunId("r")
	                 .WithEventTime("t")
	                 .WithJob("ns", "job")
	                 .AddOutputDataset("lookml", "buyers")
	                 .AddOutputDatasetFacet_SymlinksIdentifiers("lookml", "buyers", "lookml", "customers", "VIEW")
	                 .AddOutputDatasetFacet_SymlinksIdentifiers("lookml", "buyers", "bigquery", "proj.ds.c", "TABLE")
	                 .Build();
	const auto &identifiers = event["outputs"][0]["facets"]["symlinks"]["identifiers"];
	ASSERT_EQ(identifiers.size(), 2u);
	EXPECT_EQ(identifiers[0]["name"], "customers");
	EXPECT_EQ(identifiers[1]["type"], "TABLE");
}

TEST(LineageEventBuilderTest, ParentFacet) {
	auto with_job = LineageEventBuilder::CreateComplete()
	                    .WithRunId("r")
	                    .WithEventTime("t")
	                    .WithJob("ns", "job")
	                    .AddRunFacet_Parent("parent-run", "airflow", "dag.task")
	                    .Build();
	EXPECT_EQ(with_job["run"]["runId"], "r");
	EXPECT_EQ(with_job["run"]["facets"]["parent"]["run"]["runId"], "parent-run");
	EXPECT_EQ(with_job["run"]["facets"]["parent"]["job"]["name"], "dag.task");

	auto run_only = LineageEventBuilder::CreateComplete()
	                    .WithRunId("r")
	                    .WithEventTime("t")
	                    .WithJob("ns", "job")
	                    .AddRunFacet_Parent("parent-run", "airflow")
	                    .Build();
	EXPECT_FALSE(run_only["run"]["facets"]["parent"].contains("job"));
}

TEST(LineageEventBuilderTest, WithProducerAndCompactString) {
	std::string text = LineageEventBuilder::CreateComplete()
	                       .WithRunId("r")
	                       .WithEventTime("t")
	                       .WithJob("ns", "job")
	                       .WithProducer("https://example.com/producer")
	                       .BuildString();
	auto parsed = json::parse(text);
	EXPECT_EQ(parsed["producer"], "https://example.com/producer");
	EXPECT_EQ(text.find('\n'), std::string::npos);
}
