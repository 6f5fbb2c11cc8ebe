#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace Bacon {

/**
 * @brief The two vertex variants of the actor/movie graph.
 */
enum class NodeKind {
    ACTOR, ///< A performer, declared by a "<a>" line.
    MOVIE  ///< A title, declared by a "<t>" line under an actor.
};

/**
 * @brief Line marker of a node variant.
 *
 * The same marker is used to tag input lines and to wrap names when a
 * path is rendered.
 */
inline const char* marker(NodeKind kind)
{
    return kind == NodeKind::ACTOR ? "<a>" : "<t>";
}

/**
 * @brief Immutable bipartite actor/movie graph.
 *
 * Vertices are dense integer ids.  Actors occupy [0, num_actors) and
 * movies occupy [num_actors, num_actors + num_movies), so the variant of
 * a vertex follows from its id alone.
 *
 * @par Graph convention (CSR format)
 * | Symbol | Meaning                              |
 * |--------|--------------------------------------|
 * | Gp     | Row pointers (size G_N + 1)          |
 * | Gi     | Column indices (size Gp[G_N])        |
 * | G_N    | Number of vertices                   |
 *
 * Every edge is stored in both directions and never joins two vertices
 * of the same variant.
 */
struct BipartiteGraph {
    int num_actors = 0;                               ///< Number of actor vertices.
    int num_movies = 0;                               ///< Number of movie vertices.
    std::vector<std::string> names;                   ///< Display name of every vertex.
    std::vector<int> Gp;                              ///< CSR row pointers.
    std::vector<int> Gi;                              ///< CSR column indices.
    std::unordered_map<std::string, int> actor_ids;   ///< Actor name -> vertex id.

    int num_vertices() const { return num_actors + num_movies; }

    NodeKind kind(int v) const
    {
        return v < num_actors ? NodeKind::ACTOR : NodeKind::MOVIE;
    }

    /// Vertex id of the named actor, or -1 if there is no such actor.
    int find_actor(const std::string& name) const
    {
        auto it = actor_ids.find(name);
        return it == actor_ids.end() ? -1 : it->second;
    }
};

} // namespace Bacon
