#include "BFS.h"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <string>

namespace Bacon::BFS {

void single_source_bfs(
    const int* Gp, const int* Gi, int G_N,
    int source,
    std::vector<int>& dist,
    std::vector<int>& parent)
{
    if (source < 0 || source >= G_N)
        throw std::out_of_range("BFS source " + std::to_string(source) +
                                " out of range [0.." + std::to_string(G_N) + ")");

    dist.assign(G_N, UNREACHED);
    parent.assign(G_N, NO_PARENT);

    std::queue<int> frontier;
    dist[source] = 0;
    frontier.push(source);

    while (!frontier.empty()) {
        int v = frontier.front();
        frontier.pop();
        for (int j = Gp[v]; j < Gp[v + 1]; j++) {
            int u = Gi[j];
            if (dist[u] != UNREACHED) continue;
            dist[u]   = dist[v] + 1;
            parent[u] = v;
            frontier.push(u);
        }
    }
}

void trace_path(
    const std::vector<int>& parent,
    int target,
    std::vector<int>& path)
{
    path.clear();
    for (int v = target; v != NO_PARENT; v = parent[v])
        path.push_back(v);
    std::reverse(path.begin(), path.end());
}

} // namespace Bacon::BFS
