//===----------------------------------------------------------------------===//
// DuckDB LookML Lineage Extension
//
// File: alias_resolver.hpp
// Description: Marks alias views (`name != from`) as derived_from and gives
//              them an independent copy of their base view's tables.
//===----------------------------------------------------------------------===//

#pragma once

#include "lookml_model.hpp"
#include <string>
#include <vector>

namespace lookml_lineage {

/// @brief Resolve every alias relation against a registry snapshot.
/// @param views Input snapshot; not modified.
/// @param aliases Alias relations from the explore graph.
/// @return A new snapshot in which every alias is `derived_from` its base and holds a copy of the
///         base's tables, or empty tables when the base is unknown, tableless or part of a cycle.
/// @note Chains (`a -> b -> c`) are followed to the first view that is not itself an alias.
ViewRegistry ResolveAliases(const ViewRegistry &views, const std::vector<AliasRelation> &aliases);

/// @brief Follow alias links from a view to its ultimate base.
/// @return The base view name, or an empty string when the chain loops.
std::string FollowAliasChain(const std::string &view_name, const std::vector<AliasRelation> &aliases);

} // namespace lookml_lineage
