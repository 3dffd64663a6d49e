#pragma once

namespace fleet::assignment {

/*
  Multipliers and thresholds for soft scoring.

  Every adjustment is computed from the thresholds/penalties/bonuses and
  then multiplied by its factor weight before it is summed.
*/
struct ScoringWeights {
  double cpu_weight{1.0};
  double memory_weight{0.8};
  double tag_match_weight{1.5};
  double state_affinity_weight{2.0};
  double network_proximity_weight{0.5};
  double job_count_weight{1.2};

  double cpu_high_threshold{80.0};
  double cpu_medium_threshold{60.0};
  double memory_high_threshold{85.0};
  double memory_medium_threshold{70.0};

  double high_load_penalty{50.0};
  double medium_load_penalty{25.0};

  double tag_match_bonus{20.0};
  double state_affinity_bonus{100.0};
  double network_proximity_bonus{15.0};
};

} // namespace fleet::assignment
