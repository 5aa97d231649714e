#pragma once
#include <vector>

/**
 * Minimum-cost bipartite assignment for a rectangular rows x cols cost matrix,
 * solved by successive shortest augmenting paths with row/column potentials.
 *
 * A pair is eligible only when cost <= gate; a cost equal to the gate is a
 * valid match. `row_bias` (optional, one entry per row) is added to eligible
 * costs before solving and is meant for tie-breaking only: it must be small
 * compared with real cost differences.
 *
 * Returns, for each row, the assigned column or -1.
 */
std::vector<int> solve_assignment(const std::vector<std::vector<double>>& cost,
                                  double gate,
                                  const std::vector<double>& row_bias = {});
