#include "prepcast/ingest/item_resolver.hpp"
#include "prepcast/core/errors.hpp"
#include "prepcast/ingest/normalizer.hpp"
#include "prepcast/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace prepcast::ingest {

namespace {

constexpr double kScoreTolerance = 1e-9;
constexpr std::size_t kMinTypoTokenLength = 5;

std::vector<std::string> tokenize(const std::string &name) {
	std::string cleaned = Normalizer::normalizeKey(name);
	for (auto &ch : cleaned) {
		if (!std::isalnum(static_cast<unsigned char>(ch))) {
			ch = ' ';
		}
	}
	std::vector<std::string> tokens;
	std::istringstream stream(cleaned);
	std::string token;
	while (stream >> token) {
		tokens.push_back(token);
	}
	return tokens;
}

std::size_t editDistance(const std::string &lhs, const std::string &rhs) {
	std::vector<std::size_t> previous(rhs.size() + 1);
	std::vector<std::size_t> current(rhs.size() + 1);
	for (std::size_t j = 0; j <= rhs.size(); ++j) {
		previous[j] = j;
	}
	for (std::size_t i = 1; i <= lhs.size(); ++i) {
		current[0] = i;
		for (std::size_t j = 1; j <= rhs.size(); ++j) {
			const std::size_t substitution = previous[j - 1] + (lhs[i - 1] == rhs[j - 1] ? 0 : 1);
			current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
		}
		std::swap(previous, current);
	}
	return previous[rhs.size()];
}

bool tokensMatch(const std::string &lhs, const std::string &rhs) {
	if (lhs == rhs) {
		return true;
	}
	if (lhs.size() < kMinTypoTokenLength || rhs.size() < kMinTypoTokenLength) {
		return false;
	}
	const auto longer = std::max(lhs.size(), rhs.size());
	const auto shorter = std::min(lhs.size(), rhs.size());
	return longer - shorter <= 1 && editDistance(lhs, rhs) <= 1;
}

} // namespace

// --- Catalog ---

const core::Item *ItemCatalog::find(core::ItemId item_id) const {
	if (item_id < 1 || static_cast<std::size_t>(item_id) > items_.size()) {
		return nullptr;
	}
	return &items_[static_cast<std::size_t>(item_id - 1)];
}

std::optional<core::ItemId> ItemCatalog::findByName(const std::string &name) const {
	const auto it = name_index_.find(Normalizer::normalizeKey(name));
	if (it == name_index_.end()) {
		return std::nullopt;
	}
	return it->second;
}

core::ItemId ItemCatalog::create(const std::string &canonical_name, const std::string &alias) {
	const auto canonical_key = Normalizer::normalizeKey(canonical_name);
	if (canonical_key.empty()) {
		throw std::invalid_argument("Canonical item name must not be blank.");
	}
	if (name_index_.count(canonical_key) != 0) {
		throw std::invalid_argument("Item name '" + canonical_name + "' is already known.");
	}
	const auto alias_key = Normalizer::normalizeKey(alias);
	if (!alias_key.empty() && alias_key != canonical_key && name_index_.count(alias_key) != 0) {
		throw std::invalid_argument("Alias '" + alias + "' is already linked to another item.");
	}

	core::Item item;
	item.item_id = next_id_++;
	item.canonical_name = canonical_name;
	item.aliases.push_back({canonical_name, core::AliasOrigin::Canonical});
	name_index_[canonical_key] = item.item_id;
	if (!alias_key.empty() && alias_key != canonical_key) {
		item.aliases.push_back({alias, core::AliasOrigin::Rule});
		name_index_[alias_key] = item.item_id;
	}
	items_.push_back(std::move(item));
	return items_.back().item_id;
}

void ItemCatalog::addAlias(core::ItemId item_id, const std::string &alias, core::AliasOrigin origin) {
	if (find(item_id) == nullptr) {
		throw std::invalid_argument("Unknown item id " + std::to_string(item_id) + ".");
	}
	const auto key = Normalizer::normalizeKey(alias);
	if (key.empty()) {
		throw std::invalid_argument("Alias must not be blank.");
	}
	const auto existing = name_index_.find(key);
	if (existing != name_index_.end()) {
		if (existing->second == item_id) {
			return;
		}
		throw std::invalid_argument("Alias '" + alias + "' is already linked to item " +
		                            std::to_string(existing->second) + ".");
	}
	name_index_[key] = item_id;
	items_[static_cast<std::size_t>(item_id - 1)].aliases.push_back({alias, origin});
}

// --- Resolver ---

ItemResolver::ItemResolver(config::ResolverSettings settings) : settings_(std::move(settings)) {
	rules_.reserve(settings_.canonical_rules.size());
	for (const auto &rule : settings_.canonical_rules) {
		rules_.push_back(
		    CompiledRule{std::regex(rule.pattern, std::regex::ECMAScript | std::regex::icase), rule.canonical});
	}
}

double ItemResolver::tokenSimilarity(const std::string &lhs, const std::string &rhs) {
	const auto left = tokenize(lhs);
	const auto right = tokenize(rhs);
	if (left.empty() || right.empty()) {
		return 0.0;
	}
	std::vector<bool> used(right.size(), false);
	std::size_t shared = 0;
	for (const auto &token : left) {
		for (std::size_t j = 0; j < right.size(); ++j) {
			if (!used[j] && tokensMatch(token, right[j])) {
				used[j] = true;
				++shared;
				break;
			}
		}
	}
	return static_cast<double>(shared) / static_cast<double>(std::max(left.size(), right.size()));
}

Resolution ItemResolver::resolve(const std::string &raw_name, ItemCatalog &catalog) const {
	const auto key = Normalizer::normalizeKey(raw_name);
	if (key.empty()) {
		throw std::invalid_argument("Empty item name cannot be resolved.");
	}

	if (auto hit = catalog.findByName(raw_name)) {
		return Resolution{*hit, ResolutionKind::Exact, 1.0};
	}

	for (const auto &rule : rules_) {
		if (!std::regex_search(raw_name, rule.pattern)) {
			continue;
		}
		// The rule target may already be known under an alias.
		if (auto existing = catalog.findByName(rule.canonical)) {
			catalog.addAlias(*existing, raw_name, core::AliasOrigin::Rule);
			PREPCAST_INFO("Linked '{}' to '{}' by canonical rule.", raw_name, rule.canonical);
			return Resolution{*existing, ResolutionKind::Rule, 1.0};
		}
		const auto created = catalog.create(rule.canonical, raw_name);
		PREPCAST_INFO("Created item {} '{}' for '{}' by canonical rule.", created, rule.canonical, raw_name);
		return Resolution{created, ResolutionKind::Rule, 1.0};
	}

	double best_score = 0.0;
	std::vector<core::ItemId> best_items;
	for (const auto &item : catalog.items()) {
		double item_score = 0.0;
		for (const auto &alias : item.aliases) {
			item_score = std::max(item_score, tokenSimilarity(raw_name, alias.alias));
		}
		if (item_score + kScoreTolerance < settings_.fuzzy_threshold) {
			continue;
		}
		if (item_score > best_score + kScoreTolerance) {
			best_score = item_score;
			best_items.assign(1, item.item_id);
		} else if (std::abs(item_score - best_score) <= kScoreTolerance) {
			best_items.push_back(item.item_id);
		}
	}

	if (best_items.size() > 1) {
		PREPCAST_WARN("Item name '{}' is ambiguous between {} items (score {:.2f}).", raw_name, best_items.size(),
		              best_score);
		throw core::ResolutionAmbiguity(raw_name, best_items);
	}
	if (best_items.size() == 1) {
		catalog.addAlias(best_items.front(), raw_name, core::AliasOrigin::Fuzzy);
		PREPCAST_INFO("Matched '{}' to item {} by token similarity {:.2f}.", raw_name, best_items.front(), best_score);
		return Resolution{best_items.front(), ResolutionKind::Fuzzy, best_score};
	}

	const auto created = catalog.create(raw_name);
	PREPCAST_DEBUG("Created item {} for new name '{}'.", created, raw_name);
	return Resolution{created, ResolutionKind::Created, 0.0};
}

} // namespace prepcast::ingest
