#include "ranker/Selector.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace ranker {

static bool is_sponsored(const ScoredCandidate& sc) {
    return sc.candidate.sponsor_tier != SponsorTier::Organic;
}

static const std::string& category_of(const ScoredCandidate& sc) {
    return sc.evidence.category;
}

int effective_k(const SelectorConfig& cfg) {
    return std::max(cfg.k, cfg.min_k);
}

int max_sponsored(int k, const SelectorConfig& cfg) {
    if (k <= 0 || cfg.max_sponsored_ratio <= 0.0) return 0;
    // small epsilon so 0.4 * 5 lands on 2 rather than 1.999...
    return static_cast<int>(std::floor(cfg.max_sponsored_ratio * k + 1e-9));
}

// Lowest-ranked selected entry in a category that has more than one member,
// so removing it cannot reduce the number of distinct categories. Selected
// entries hold pool indices, and the pool is in rank order, so the largest
// index is the lowest score.
static int find_lowest_replaceable_index(
    const std::vector<size_t>& selected,
    const std::vector<const ScoredCandidate*>& pool,
    const std::unordered_map<std::string, int>& category_counts,
    bool must_be_sponsored
) {
    int best_i = -1;
    size_t best_pool_index = 0;

    for (int i = 0; i < (int)selected.size(); ++i) {
        const ScoredCandidate& sc = *pool[selected[i]];
        if (must_be_sponsored && !is_sponsored(sc)) continue;

        auto it = category_counts.find(category_of(sc));
        if (it == category_counts.end() || it->second <= 1) continue;

        if (best_i < 0 || selected[i] > best_pool_index) {
            best_i = i;
            best_pool_index = selected[i];
        }
    }
    return best_i;
}

SelectorResult select_candidates(const std::vector<ScoredCandidate>& scored, const SelectorConfig& cfg) {
    SelectorResult res;
    res.cfg = cfg;
    res.effective_k = effective_k(cfg);
    res.sponsor_cap = max_sponsored(res.effective_k, cfg);
    res.decisions.reserve(scored.size());

    if (cfg.k < cfg.min_k) {
        spdlog::warn("requested k={} is below the minimum of {}; using {}", cfg.k, cfg.min_k, res.effective_k);
    }

    const int k = res.effective_k;

    std::vector<ScoredCandidate> ordered = scored;
    std::stable_sort(ordered.begin(), ordered.end(), ranks_before);

    // Rule 1: at most one candidate per business; the highest-ranked one wins.
    std::vector<const ScoredCandidate*> pool;
    pool.reserve(ordered.size());
    {
        std::unordered_set<std::string> seen_business;
        seen_business.reserve(ordered.size() * 2 + 8);

        for (const auto& sc : ordered) {
            const auto& bid = sc.candidate.business_id;
            if (bid && !bid->empty() && !seen_business.insert(*bid).second) {
                res.decisions.push_back(SelectionDecision{sc.candidate.id, false, "duplicate_business"});
                continue;
            }
            pool.push_back(&sc);
        }
    }

    std::unordered_set<std::string> pool_categories;
    for (const auto* sc : pool) pool_categories.insert(category_of(*sc));
    res.available_categories = static_cast<int>(pool_categories.size());

    std::vector<size_t> selected;
    selected.reserve(std::min(pool.size(), static_cast<size_t>(k)));
    std::vector<bool> taken(pool.size(), false);
    std::unordered_map<std::string, int> category_counts;
    int sponsored = 0;

    // Rule 2: greedy fill in rank order under the sponsorship cap.
    for (size_t i = 0; i < pool.size(); ++i) {
        const ScoredCandidate& sc = *pool[i];

        if ((int)selected.size() >= k) {
            res.decisions.push_back(SelectionDecision{sc.candidate.id, false, "total_cap"});
            continue;
        }
        if (is_sponsored(sc) && sponsored >= res.sponsor_cap) {
            res.decisions.push_back(SelectionDecision{sc.candidate.id, false, "sponsor_cap"});
            continue;
        }

        selected.push_back(i);
        taken[i] = true;
        category_counts[category_of(sc)]++;
        if (is_sponsored(sc)) ++sponsored;
        res.decisions.push_back(SelectionDecision{sc.candidate.id, true, "selected"});
    }

    // Rule 3: diversity floor. Bring in the best candidate of each absent
    // category, evicting the weakest member of an over-represented category.
    // Each pool entry is considered once, so this is bounded by |pool| * k.
    const int target = std::min({cfg.min_categories, res.available_categories, k});

    for (size_t ci = 0; ci < pool.size() && (int)category_counts.size() < target; ++ci) {
        if (taken[ci]) continue;

        const ScoredCandidate& cand = *pool[ci];
        if (category_counts.count(category_of(cand)) > 0) continue;

        const bool cand_sponsored = is_sponsored(cand);
        const bool cap_full = sponsored >= res.sponsor_cap;

        if ((int)selected.size() < k) {
            if (cand_sponsored && cap_full) continue;

            selected.push_back(ci);
            taken[ci] = true;
            category_counts[category_of(cand)]++;
            if (cand_sponsored) ++sponsored;
            res.decisions.push_back(SelectionDecision{cand.candidate.id, true, "diversity_swap_in"});
            continue;
        }

        // A sponsored newcomer under a full cap may only displace another sponsored entry.
        const int replace_i = find_lowest_replaceable_index(selected, pool, category_counts, cand_sponsored && cap_full);
        if (replace_i < 0) continue;

        const ScoredCandidate& old = *pool[selected[replace_i]];
        spdlog::debug("diversity swap: {} [{}] -> {} [{}]",
                      old.candidate.id, category_of(old), cand.candidate.id, category_of(cand));

        taken[selected[replace_i]] = false;
        category_counts[category_of(old)]--;
        if (is_sponsored(old)) --sponsored;
        res.decisions.push_back(SelectionDecision{old.candidate.id, false, "diversity_swap_out"});

        selected[replace_i] = ci;
        taken[ci] = true;
        category_counts[category_of(cand)]++;
        if (cand_sponsored) ++sponsored;
        res.decisions.push_back(SelectionDecision{cand.candidate.id, true, "diversity_swap_in"});
    }

    if ((int)category_counts.size() < target) {
        spdlog::warn("diversity floor not reached: {} of {} categories", category_counts.size(), target);
    }

    // Final deterministic ordering: pool index order is rank order.
    std::sort(selected.begin(), selected.end());

    res.selected.reserve(selected.size());
    for (size_t idx : selected) {
        const ScoredCandidate& sc = *pool[idx];

        Recommendation rec;
        rec.candidate = sc.candidate;
        rec.score = sc.score;
        rec.evidence = sc.evidence;
        rec.is_sponsored = is_sponsored(sc);
        res.selected.push_back(std::move(rec));
    }

    return res;
}

SelectorResult select_candidates(const std::vector<ScoredCandidate>& scored, int k, const SelectorConfig& cfg) {
    SelectorConfig c = cfg;
    c.k = k;
    return select_candidates(scored, c);
}

}  // namespace ranker
