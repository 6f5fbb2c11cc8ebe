#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Graph.h"
#include "Records.h"

namespace Bacon {

/**
 * @brief Incrementally collects actor/movie records into a BipartiteGraph.
 *
 * Records are consumed in input order.  An actor record sets the current
 * actor; a movie record credits the current actor with that movie.
 *
 * Rules for irregular input:
 *   - A movie record that arrives before any actor record is skipped and
 *     counted in orphan_movie_records().
 *   - A repeated actor name does not create a second vertex.  The first
 *     declaration wins: the existing actor becomes current again and the
 *     movies that follow are added to its credits.
 *   - Crediting the same actor with the same movie twice yields a single
 *     edge.
 */
class GraphBuilder {
public:
    /**
     * @param expected_number_of_actors  Capacity hint for the actor map.
     * @param expected_number_of_movies  Capacity hint for the movie map.
     * @throws std::invalid_argument if either hint is negative.
     */
    GraphBuilder(int expected_number_of_actors, int expected_number_of_movies);

    /// Dispatch on the record variant.
    void add_record(const Record& record);

    void add_actor(const std::string& name);

    void add_movie(const std::string& title);

    /**
     * @brief Assemble the CSR graph from everything added so far.
     *
     * The (actor, movie) credits are placed into a symmetric Eigen sparse
     * matrix whose compressed row-major storage is the CSR adjacency.
     * The movie title map is not carried into the result.
     */
    BipartiteGraph build() const;

    int num_actors() const { return static_cast<int>(actor_names_.size()); }
    int num_movies() const { return static_cast<int>(movie_names_.size()); }
    int num_credits() const { return static_cast<int>(credits_.size()); }
    int orphan_movie_records() const { return orphan_movie_records_; }
    int duplicate_actor_records() const { return duplicate_actor_records_; }

private:
    std::vector<std::string> actor_names_;
    std::vector<std::string> movie_names_;
    std::unordered_map<std::string, int> actor_ids_;
    std::unordered_map<std::string, int> movie_ids_;
    std::vector<std::pair<int, int>> credits_;  // (actor index, movie index)

    int current_actor_ = -1;
    int orphan_movie_records_ = 0;
    int duplicate_actor_records_ = 0;
};

} // namespace Bacon
