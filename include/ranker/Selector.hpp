#pragma once

#include <string>
#include <vector>

#include "ranker/Scorer.hpp"

namespace ranker {

struct SelectorConfig {
    int k = 10;
    int min_k = 5;
    double max_sponsored_ratio = 0.4;  // of k, floored
    int min_categories = 3;
};

struct SelectionDecision {
    std::string candidate_id;
    bool accepted = false;
    std::string reason;
};

struct Recommendation {
    Candidate candidate;
    ScoreBreakdown score;
    ScoreEvidence evidence;
    std::string explanation;
    bool is_sponsored = false;
};

struct SelectorResult {
    SelectorConfig cfg;
    int effective_k = 0;
    int sponsor_cap = 0;
    int available_categories = 0;              // distinct categories after duplicate-business exclusion
    std::vector<Recommendation> selected;      // final score order, explanation left empty
    std::vector<SelectionDecision> decisions;  // in the order they were taken
};

// k clamped up to cfg.min_k
int effective_k(const SelectorConfig& cfg);

// floor(max_sponsored_ratio * k)
int max_sponsored(int k, const SelectorConfig& cfg);

// Deterministic for any input order: candidates are re-ranked by final score
// desc, then id asc, before the business rules run.
SelectorResult select_candidates(const std::vector<ScoredCandidate>& scored, const SelectorConfig& cfg);
SelectorResult select_candidates(const std::vector<ScoredCandidate>& scored, int k, const SelectorConfig& cfg = {});

}  // namespace ranker
