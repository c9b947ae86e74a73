#pragma once

#include "prepcast/config/settings.hpp"
#include "prepcast/core/sales.hpp"

#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace prepcast::ingest {

/**
 * @class ItemCatalog
 * @brief Canonical items and their aliases.
 *
 * Item ids are assigned sequentially and never reused. Names are indexed by
 * their case- and whitespace-insensitive key; one key maps to one item.
 */
class ItemCatalog {
public:
	const core::Item *find(core::ItemId item_id) const;

	/// Item whose canonical name or alias has the same normalized key as @p name.
	std::optional<core::ItemId> findByName(const std::string &name) const;

	/**
	 * @brief Creates a new item; @p alias is recorded when it differs from the canonical name.
	 * @throws std::invalid_argument If either name is already known.
	 */
	core::ItemId create(const std::string &canonical_name, const std::string &alias = {});

	/**
	 * @brief Links @p alias to an existing item.
	 *
	 * Re-linking an alias to the item that already owns it is a no-op.
	 * @throws std::invalid_argument If the item is unknown or the alias belongs to another item.
	 */
	void addAlias(core::ItemId item_id, const std::string &alias, core::AliasOrigin origin);

	const std::vector<core::Item> &items() const {
		return items_;
	}

	std::size_t size() const {
		return items_.size();
	}

private:
	std::vector<core::Item> items_;
	std::unordered_map<std::string, core::ItemId> name_index_;
	core::ItemId next_id_ = 1;
};

enum class ResolutionKind { Exact, Rule, Fuzzy, Created };

struct Resolution {
	core::ItemId item_id = 0;
	ResolutionKind kind = ResolutionKind::Exact;
	double score = 1.0;
};

/**
 * @class ItemResolver
 * @brief Maps raw item names onto stable item ids.
 *
 * Lookup order: exact normalized name, configured canonical rules, fuzzy token
 * match, and finally creation of a new item named after the raw text. Two
 * existing canonical items are never merged.
 */
class ItemResolver {
public:
	explicit ItemResolver(config::ResolverSettings settings);

	/**
	 * @brief Resolves @p raw_name, registering aliases or new items in @p catalog.
	 * @throws core::ResolutionAmbiguity If two items tie for the best fuzzy score.
	 * @throws std::invalid_argument If the name is blank.
	 */
	Resolution resolve(const std::string &raw_name, ItemCatalog &catalog) const;

	/**
	 * @brief Token overlap of two names: shared tokens divided by the larger token count.
	 *
	 * Tokens of five or more characters also match at edit distance one, which absorbs typos.
	 */
	static double tokenSimilarity(const std::string &lhs, const std::string &rhs);

private:
	struct CompiledRule {
		std::regex pattern;
		std::string canonical;
	};

	config::ResolverSettings settings_;
	std::vector<CompiledRule> rules_;
};

} // namespace prepcast::ingest
