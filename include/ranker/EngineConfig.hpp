#pragma once

#include "ranker/Explainer.hpp"
#include "ranker/ProfileLearner.hpp"
#include "ranker/Scorer.hpp"
#include "ranker/Selector.hpp"

namespace ranker {

// Every tunable constant of the engine. Defaults are the production values.
struct EngineConfig {
    ScoreConfig score;
    SelectorConfig selector;
    ExplainConfig explain;
    LearnerConfig learner;
};

}  // namespace ranker
