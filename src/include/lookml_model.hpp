//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: lookml_model.hpp
// Description: Data model shared by all pipeline stages: source files, views,
//              explores, alias relations and the resolved lineage model.
//===----------------------------------------------------------------------===//

#pragma once

#include "scan_diagnostics.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace lookml_lineage {

//===--------------------------------------------------------------------===//
// Enumerations
//===--------------------------------------------------------------------===//

/// @brief How a view obtains its data.
enum class CitationType : uint8_t {
	NATIVE,          ///< Direct table reference
	DERIVED,         ///< Table name inferred from naming conventions
	DERIVED_SQL,     ///< Tables extracted from an embedded SQL body
	DERIVED_EXPLORE, ///< Built from another explore's query; no physical tables
	DERIVED_FROM,    ///< Alias of another view
	NESTED,          ///< Child of a parent view (`parent__child`)
	UNNEST           ///< Produced by flattening an array inside a join
};

/// @brief Lower-case name of a citation type (e.g., "derived_sql").
std::string CitationTypeToString(CitationType type);

/// @brief Which clause defines a view.
enum class SourceKind : uint8_t {
	UNKNOWN,        ///< No recognizable definition (or no view block at all)
	SQL_TABLE_NAME, ///< `sql_table_name: ... ;;`
	EXPLORE_SOURCE, ///< `derived_table: { explore_source: x { ... } }`
	DERIVED_SQL     ///< `derived_table: { sql: ... ;; }`
};

/// @brief Lower-case name of a source kind (e.g., "sql_table_name").
std::string SourceKindToString(SourceKind kind);

/// @brief Whether a file is scanned for views or for models and explores.
enum class FileCategory : uint8_t { MODEL, VIEW };

//===--------------------------------------------------------------------===//
// Entities
//===--------------------------------------------------------------------===//

/// @brief One LookML file read from the project.
struct SourceFile {
	std::string path; ///< Path relative to the project root, '/' separated
	std::string text;
	FileCategory category = FileCategory::VIEW;
	std::string model_name; ///< Owning model for model-like files
};

/// @brief All files of one project, split by category.
struct SourceCorpus {
	std::vector<SourceFile> view_files;
	std::vector<SourceFile> model_files;
};

/// @brief The defining clause of a view, kept verbatim.
struct SourceDefinition {
	SourceKind kind = SourceKind::UNKNOWN;
	std::string text; ///< Table expression, SQL body or explore name, depending on kind
};

/// @brief Provenance record for one view.
struct ViewRecord {
	std::string name;
	CitationType citation_type = CitationType::NATIVE;
	std::string primary_table; ///< Empty when the view has no table
	std::vector<std::string> additional_tables;
	std::string derived_from; ///< Base view name for aliases
	SourceDefinition source;
	std::string source_file; ///< File that declares the view (empty if never declared)
	size_t explore_count = 0;

	bool HasTables() const {
		return !primary_table.empty();
	}

	void ClearTables() {
		primary_table.clear();
		additional_tables.clear();
	}
};

/// @brief One explore and the views it reaches.
struct ExploreRecord {
	std::string name;
	std::string model_name;
	std::string base_view;
	std::vector<std::string> joined_views; ///< Direct and nested joins, first-seen order
	std::string source_file;

	/// @brief Base view followed by the joined views, without duplicates.
	std::vector<std::string> ViewSet() const;
};

/// @brief `alias_view` is declared as `from: base_view` at an explore or join site.
struct AliasRelation {
	std::string alias_view;
	std::string base_view;

	bool operator==(const AliasRelation &other) const {
		return alias_view == other.alias_view && base_view == other.base_view;
	}
};

//===--------------------------------------------------------------------===//
// View Registry
//===--------------------------------------------------------------------===//

/// @class ViewRegistry
/// @brief Insertion-ordered map of view name to ViewRecord.
///
/// Copying a registry copies every record, so a pipeline stage can return a new
/// snapshot without sharing state with its input.
class ViewRegistry {
public:
	/// @brief Get the record for a name, inserting a default one if absent.
	/// @param inserted Set to true when a new record was created.
	ViewRecord &GetOrAdd(const std::string &name, bool *inserted = nullptr);

	ViewRecord *Find(const std::string &name);
	const ViewRecord *Find(const std::string &name) const;

	bool Contains(const std::string &name) const {
		return index.find(name) != index.end();
	}

	size_t Size() const {
		return views.size();
	}

	std::vector<ViewRecord> &Views() {
		return views;
	}

	const std::vector<ViewRecord> &Views() const {
		return views;
	}

private:
	std::vector<ViewRecord> views;
	std::unordered_map<std::string, size_t> index;
};

//===--------------------------------------------------------------------===//
// Lineage Model
//===--------------------------------------------------------------------===//

/// @brief Complete result of one analysis run.
struct LineageModel {
	ViewRegistry views;
	std::vector<ExploreRecord> explores;
	std::vector<AliasRelation> aliases;
	std::set<std::string> unnest_views;
	std::vector<ScanWarning> warnings;

	/// @brief Views ordered for reporting: explore count descending, then name descending.
	std::vector<const ViewRecord *> ReportOrder() const;
};

} // namespace lookml_lineage
