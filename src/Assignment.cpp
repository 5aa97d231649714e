#include "Assignment.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using namespace std;

vector<int> solve_assignment(const vector<vector<double>>& cost,
                             double gate,
                             const vector<double>& row_bias)
{
    const int rows = int(cost.size());
    const int cols = rows ? int(cost[0].size()) : 0;
    vector<int> result(rows, -1);
    if (rows == 0 || cols == 0) return result;

    // Forbidden cells stay finite so the potentials remain well conditioned.
    const double forbidden = 1e4 * (fabs(gate) + 1.0);
    const int n = max(rows, cols);

    // Square working matrix; padding rows/columns are free "no match" slots.
    vector<vector<double>> w(n, vector<double>(n, 0.0));
    for (int i = 0; i < rows; ++i) {
        double bias = i < int(row_bias.size()) ? row_bias[i] : 0.0;
        for (int j = 0; j < cols; ++j) {
            double c = cost[i][j];
            w[i][j] = (isfinite(c) && c <= gate) ? c + bias : forbidden;
        }
        for (int j = cols; j < n; ++j) w[i][j] = forbidden * 0.5;
    }

    // Successive shortest augmenting paths: for each row a Dijkstra search
    // over columns on reduced costs, then a dual update and path flip.
    const double inf = numeric_limits<double>::infinity();
    vector<double> u(n, 0.0), v(n, 0.0);
    vector<int> row_of(n, -1), col_of(n, -1);

    for (int start = 0; start < n; ++start) {
        vector<double> dist(n, inf);
        vector<int>    via(n, -1);
        vector<char>   row_seen(n, false), col_seen(n, false);
        double reach = 0.0;
        int row = start, sink = -1;

        while (sink < 0) {
            row_seen[row] = true;
            int best = -1;
            for (int j = 0; j < n; ++j) {
                if (col_seen[j]) continue;
                double d = reach + w[row][j] - u[row] - v[j];
                if (d < dist[j]) {
                    dist[j] = d;
                    via[j] = row;
                }
                // ties go to a free column
                if (best < 0 || dist[j] < dist[best] ||
                    (dist[j] == dist[best] && row_of[j] < 0 && row_of[best] >= 0))
                    best = j;
            }
            reach = dist[best];
            col_seen[best] = true;
            if (row_of[best] < 0)
                sink = best;
            else
                row = row_of[best];
        }

        u[start] += reach;
        for (int i = 0; i < n; ++i)
            if (row_seen[i] && i != start) u[i] += reach - dist[col_of[i]];
        for (int j = 0; j < n; ++j)
            if (col_seen[j]) v[j] -= reach - dist[j];

        for (int j = sink;;) {
            int i = via[j];
            row_of[j] = i;
            swap(col_of[i], j);
            if (i == start) break;
        }
    }

    for (int j = 0; j < cols; ++j) {
        int i = row_of[j];
        if (i >= 0 && i < rows && w[i][j] < forbidden) result[i] = j;
    }
    return result;
}
