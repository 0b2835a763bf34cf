#pragma once

#include <covenant/schema/routing_tier.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace covenant::admission {

struct classification_t final {
  covenant::schema::routing_tier_t tier{covenant::schema::routing_tier_t::low};
  std::vector<std::string> concepts;
  std::string reason;
};

/// Gate 1. Runs on the classifier pool under a hard timeout; a timeout, an
/// exception or a blocked tier falls back to low.
using intent_classifier_t =
    std::function<classification_t(std::string_view input)>;

/// Keyword heuristic used when no classifier is injected: simple queries are
/// medium, batch chores are low, everything else needs reasoning and is high.
classification_t classify_heuristically(std::string_view input);

intent_classifier_t make_heuristic_classifier();

}  // namespace covenant::admission
