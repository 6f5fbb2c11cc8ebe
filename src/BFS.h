#pragma once
#include <vector>

// ---------------------------------------------------------------------------
// BFS namespace: single-source shortest paths on unweighted CSR graphs.
//
// Graph convention:
//   Gp  -- row pointers   (size G_N + 1)
//   Gi  -- column indices  (size Gp[G_N])
//   G_N -- number of vertices
//
// Results are kept outside the graph:
//   dist[v]   -- hop count from the source, or UNREACHED.
//   parent[v] -- vertex one hop closer to the source, or NO_PARENT for the
//                source itself and for unreached vertices.
// ---------------------------------------------------------------------------
namespace Bacon::BFS {

constexpr int UNREACHED = -1;
constexpr int NO_PARENT = -1;

// Single-source BFS with a FIFO frontier.
// dist and parent are resized to G_N and fully overwritten, so calling
// this again with the same graph and source reproduces the same arrays.
// A vertex's distance and parent are fixed the first time it is
// discovered.
void single_source_bfs(
    const int* Gp, const int* Gi, int G_N,
    int source,
    std::vector<int>& dist,
    std::vector<int>& parent);

// Walk parent links from target up to the root of the BFS tree.
// path is filled root first, target last.  An unreached target yields
// the single-element path {target}.
void trace_path(
    const std::vector<int>& parent,
    int target,
    std::vector<int>& path);

} // namespace Bacon::BFS
