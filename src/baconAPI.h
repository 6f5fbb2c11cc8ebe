#pragma once
#include <optional>
#include <string>
#include <vector>

#include "BaconErrors.h"
#include "Graph.h"
#include "Records.h"

/**
 * @brief Public API of the bacon-number library.
 */
namespace Bacon {

class GraphBuilder;

/**
 * @brief Construction parameters of a BaconGraph.
 *
 * The capacity hints only pre-size the internal hash maps; they have no
 * observable effect on the results.
 */
struct BaconOptions {
    std::string reference_actor = "Bacon, Kevin (I)"; ///< Actor all distances are measured from.
    int expected_number_of_actors = 3000;             ///< Capacity hint for the actor map.
    int expected_number_of_movies = 1000;             ///< Capacity hint for the movie map.
};

/**
 * @brief Answer of a distance query.
 */
struct DistanceResult {
    enum class Status {
        NOT_FOUND,   ///< No actor with that name was loaded.
        UNREACHABLE, ///< The actor shares no chain of movies with the reference actor.
        REACHED      ///< bacon_number holds the degree of separation.
    };

    Status status = Status::NOT_FOUND;
    int bacon_number = -1; ///< Meaningful only when status == REACHED.

    static DistanceResult not_found() { return {Status::NOT_FOUND, -1}; }
    static DistanceResult unreachable() { return {Status::UNREACHABLE, -1}; }
    static DistanceResult reached(int n) { return {Status::REACHED, n}; }

    bool operator==(const DistanceResult& rhs) const
    {
        return status == rhs.status && bacon_number == rhs.bacon_number;
    }
};

/**
 * @brief One vertex on a reconstructed path.
 */
struct PathStep {
    NodeKind kind;
    std::string name;

    bool operator==(const PathStep& rhs) const
    {
        return kind == rhs.kind && name == rhs.name;
    }
};

/**
 * @brief Render a path for display.
 *
 * Every step is wrapped in the marker of its variant ("<a>" for actors,
 * "<t>" for movies) and the steps are concatenated without separators,
 * e.g. "<a>X<a><t>M1<t><a>Y<a>".
 */
std::string render_path(const std::vector<PathStep>& path);

/**
 * @brief Actor/movie graph with precomputed distances to a reference actor.
 *
 * The pipeline is:
 *   1. Read the records and collect them with a GraphBuilder.
 *   2. Assemble the bipartite CSR graph.
 *   3. Run one BFS from the reference actor.
 *
 * Construction either succeeds completely or throws.  Afterwards the
 * object is read-only; queries never modify it.
 */
class BaconGraph {
public:
    /**
     * @brief Load a data file and compute all distances.
     *
     * @param file  Path of the data file ("<a>"/"<t>" line format).
     * @param opt   Pointer to options, or @c nullptr for the defaults.
     * @throws std::invalid_argument for a blank file name, a blank
     *         reference actor or negative capacity hints.
     * @throws InputError if the file is missing or unreadable.
     * @throws NoReferenceActorError if the reference actor is not in the file.
     */
    explicit BaconGraph(const std::string& file, const BaconOptions* opt = nullptr);

    /**
     * @brief Build from records already in memory.
     *
     * Same pipeline and errors as the file constructor, minus file I/O.
     */
    explicit BaconGraph(const std::vector<Record>& records, const BaconOptions* opt = nullptr);

    /**
     * @brief Degree of separation between @p actor and the reference actor.
     * @throws std::invalid_argument if @p actor is blank.
     */
    DistanceResult lookup_distance(const std::string& actor) const;

    /**
     * @brief Chain of vertices from the reference actor to @p actor.
     *
     * Alternates actor and movie steps, starting at the reference actor
     * and ending at @p actor.  For an unreachable actor the chain holds
     * only the actor itself, so check lookup_distance() first.
     *
     * @return std::nullopt if no actor with that name was loaded.
     * @throws std::invalid_argument if @p actor is blank.
     */
    std::optional<std::vector<PathStep>> lookup_path(const std::string& actor) const;

    /// lookup_path() passed through render_path().
    std::optional<std::string> bacon_path(const std::string& actor) const;

    /**
     * @brief Recompute distances and predecessors from the reference actor.
     *
     * Already done by the constructors.  The result depends only on the
     * graph and the reference actor, so repeating it changes nothing.
     */
    void traverse();

    const std::string& reference_actor() const { return opt_.reference_actor; }
    int num_actors() const { return graph_.num_actors; }
    int num_movies() const { return graph_.num_movies; }
    /// Number of distinct actor/movie credits (undirected edges).
    int num_edges() const { return static_cast<int>(graph_.Gi.size()) / 2; }

    /// Raw BFS distance of every vertex (BFS::UNREACHED if not reached).
    const std::vector<int>& distances() const { return dist_; }
    /// BFS predecessor of every vertex (BFS::NO_PARENT for none).
    const std::vector<int>& predecessors() const { return parent_; }
    const BipartiteGraph& graph() const { return graph_; }

private:
    void set_options(const BaconOptions* opt);
    void assemble(const GraphBuilder& builder);
    int actor_id(const std::string& actor) const;

    BaconOptions opt_;
    BipartiteGraph graph_;
    int reference_ = -1;
    std::vector<int> dist_;
    std::vector<int> parent_;
};

} // namespace Bacon
