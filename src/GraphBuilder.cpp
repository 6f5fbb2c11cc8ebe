#include "GraphBuilder.h"

#include <stdexcept>
#include <Eigen/SparseCore>
#include <spdlog/spdlog.h>

namespace Bacon {

GraphBuilder::GraphBuilder(int expected_number_of_actors, int expected_number_of_movies)
{
    if (expected_number_of_actors < 0 || expected_number_of_movies < 0)
        throw std::invalid_argument("Expected number of actors and movies can't be negative");

    actor_ids_.reserve(expected_number_of_actors);
    movie_ids_.reserve(expected_number_of_movies);
    actor_names_.reserve(expected_number_of_actors);
    movie_names_.reserve(expected_number_of_movies);
}

void GraphBuilder::add_record(const Record& record)
{
    if (record.kind == NodeKind::ACTOR)
        add_actor(record.text);
    else
        add_movie(record.text);
}

void GraphBuilder::add_actor(const std::string& name)
{
    auto inserted = actor_ids_.emplace(name, num_actors());
    if (!inserted.second) {
        duplicate_actor_records_++;
        spdlog::debug("Actor \"{}\" declared again; extending the first declaration", name);
    } else {
        actor_names_.push_back(name);
    }
    current_actor_ = inserted.first->second;
}

void GraphBuilder::add_movie(const std::string& title)
{
    if (current_actor_ < 0) {
        orphan_movie_records_++;
        spdlog::debug("Movie \"{}\" has no preceding actor; skipped", title);
        return;
    }

    auto inserted = movie_ids_.emplace(title, num_movies());
    if (inserted.second)
        movie_names_.push_back(title);
    credits_.emplace_back(current_actor_, inserted.first->second);
}

// -----------------------------------------------------------------------
// Assemble the symmetric adjacency.
//
// Actor a keeps id a, movie m gets id num_actors + m.  Each credit
// contributes the two entries (a, m) and (m, a).  setFromTriplets sums
// repeated entries, so a repeated credit stays a single edge.
// -----------------------------------------------------------------------
BipartiteGraph GraphBuilder::build() const
{
    BipartiteGraph graph;
    graph.num_actors = num_actors();
    graph.num_movies = num_movies();
    const int G_N = graph.num_vertices();

    graph.names.reserve(G_N);
    graph.names.insert(graph.names.end(), actor_names_.begin(), actor_names_.end());
    graph.names.insert(graph.names.end(), movie_names_.begin(), movie_names_.end());
    graph.actor_ids = actor_ids_;

    if (G_N == 0) {
        graph.Gp.assign(1, 0);
        return graph;
    }

    std::vector<Eigen::Triplet<int>> triplets;
    triplets.reserve(2 * credits_.size());
    for (const auto& credit : credits_) {
        int a = credit.first;
        int m = graph.num_actors + credit.second;
        triplets.emplace_back(a, m, 1);
        triplets.emplace_back(m, a, 1);
    }

    Eigen::SparseMatrix<int, Eigen::RowMajor> A(G_N, G_N);
    A.setFromTriplets(triplets.begin(), triplets.end());
    A.makeCompressed();

    graph.Gp.assign(A.outerIndexPtr(), A.outerIndexPtr() + G_N + 1);
    graph.Gi.assign(A.innerIndexPtr(), A.innerIndexPtr() + A.nonZeros());
    return graph;
}

} // namespace Bacon
