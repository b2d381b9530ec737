#pragma once

#include <optional>
#include <string>
#include <vector>

#include "jobguard/core/v1/value.pb.h"

namespace jobguard::automation {

struct CandidateElement {
  std::string selector;
  std::string description;
};

struct OracleRequest {
  std::string                   dom_summary;
  core::v1::MapValue            context;
  std::vector<CandidateElement> candidate_elements;
};

struct OracleSuggestion {
  std::string              suggested_selector;
  double                   confidence = 0.0;
  std::string              reasoning;
  std::vector<std::string> alternative_selectors;
};

/*
  DecisionOracle

  Suggests a selector once every deterministic route has failed. An LLM
  call and a static heuristic are interchangeable here. The router bounds
  the response time; a late answer or an exception counts as no
  suggestion.
*/
class DecisionOracle {
 public:
  virtual ~DecisionOracle() = default;

  virtual std::optional<OracleSuggestion> Suggest(const OracleRequest& request) = 0;
};

} // namespace jobguard::automation
