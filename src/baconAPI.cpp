#include "baconAPI.h"
#include "BFS.h"
#include "GraphBuilder.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace Bacon {

std::string render_path(const std::vector<PathStep>& path)
{
    std::string out;
    for (const PathStep& step : path) {
        const char* m = marker(step.kind);
        out += m;
        out += step.name;
        out += m;
    }
    return out;
}

BaconGraph::BaconGraph(const std::string& file, const BaconOptions* opt)
{
    auto start = std::chrono::high_resolution_clock::now();
    set_options(opt);
    if (is_blank(file))
        throw std::invalid_argument("File name can't be blank");

    // ── Step 1: Read records ──────────────────────────────────────────
    spdlog::info("Step 1: Reading records from {}", file);
    auto step_start = std::chrono::high_resolution_clock::now();
    GraphBuilder builder(opt_.expected_number_of_actors, opt_.expected_number_of_movies);
    RecordStats stats;
    read_records(file, [&builder](const Record& r) { builder.add_record(r); }, &stats);
    auto step_end = std::chrono::high_resolution_clock::now();
    double step_1_runtime = std::chrono::duration<double, std::milli>(step_end - step_start).count();
    spdlog::info("File read in {:.2f} ms: {} lines, {} skipped", step_1_runtime, stats.lines, stats.skipped_lines);

    assemble(builder);

    auto end = std::chrono::high_resolution_clock::now();
    spdlog::info("Total time: {:.2f} ms", std::chrono::duration<double, std::milli>(end - start).count());
}

BaconGraph::BaconGraph(const std::vector<Record>& records, const BaconOptions* opt)
{
    auto start = std::chrono::high_resolution_clock::now();
    set_options(opt);

    spdlog::info("Step 1: Loading {} records", records.size());
    GraphBuilder builder(opt_.expected_number_of_actors, opt_.expected_number_of_movies);
    for (const Record& r : records)
        builder.add_record(r);

    assemble(builder);

    auto end = std::chrono::high_resolution_clock::now();
    spdlog::info("Total time: {:.2f} ms", std::chrono::duration<double, std::milli>(end - start).count());
}

void BaconGraph::set_options(const BaconOptions* opt)
{
    if (opt != nullptr)
        opt_ = *opt;
    if (is_blank(opt_.reference_actor))
        throw std::invalid_argument("Reference actor can't be blank");
    if (opt_.expected_number_of_actors < 0 || opt_.expected_number_of_movies < 0)
        throw std::invalid_argument("Expected number of actors and movies can't be negative");
}

// -----------------------------------------------------------------------
// Steps 2 and 3, shared by both constructors: assemble the CSR graph,
// locate the reference actor and run the BFS.
// -----------------------------------------------------------------------
void BaconGraph::assemble(const GraphBuilder& builder)
{
    spdlog::info("Actors read: {}", builder.num_actors());
    spdlog::info("Movies read: {}", builder.num_movies());
    if (builder.orphan_movie_records() > 0)
        spdlog::warn("{} movie records appeared before any actor and were skipped",
                     builder.orphan_movie_records());
    if (builder.duplicate_actor_records() > 0)
        spdlog::warn("{} repeated actor declarations were merged into the first one",
                     builder.duplicate_actor_records());

    // ── Step 2: Assemble bipartite graph ──────────────────────────────
    spdlog::info("Step 2: Assembling bipartite graph");
    auto start = std::chrono::high_resolution_clock::now();
    graph_ = builder.build();
    auto end = std::chrono::high_resolution_clock::now();
    double step_2_runtime = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::info("Graph: {} vertices, {} directed edges in {:.2f} ms",
                 graph_.num_vertices(), graph_.Gi.size(), step_2_runtime);

    reference_ = graph_.find_actor(opt_.reference_actor);
    if (reference_ < 0)
        throw NoReferenceActorError("Reference actor \"" + opt_.reference_actor + "\" was not found");

    // ── Step 3: Breadth-first search ──────────────────────────────────
    traverse();
}

void BaconGraph::traverse()
{
    spdlog::info("Step 3: Breadth-first search from {}", opt_.reference_actor);
    auto start = std::chrono::high_resolution_clock::now();
    BFS::single_source_bfs(graph_.Gp.data(), graph_.Gi.data(), graph_.num_vertices(),
                           reference_, dist_, parent_);
    auto end = std::chrono::high_resolution_clock::now();
    double step_3_runtime = std::chrono::duration<double, std::milli>(end - start).count();

    int reached_actors = static_cast<int>(std::count_if(
        dist_.begin(), dist_.begin() + graph_.num_actors,
        [](int d) { return d != BFS::UNREACHED; }));
    spdlog::info("Search done in {:.2f} ms: {} of {} actors connected",
                 step_3_runtime, reached_actors, graph_.num_actors);
}

int BaconGraph::actor_id(const std::string& actor) const
{
    if (is_blank(actor))
        throw std::invalid_argument("Actor can't be blank");
    return graph_.find_actor(actor);
}

DistanceResult BaconGraph::lookup_distance(const std::string& actor) const
{
    int v = actor_id(actor);
    if (v < 0)
        return DistanceResult::not_found();
    if (dist_[v] == BFS::UNREACHED)
        return DistanceResult::unreachable();
    // actor -> movie -> actor is one degree of separation
    return DistanceResult::reached(dist_[v] / 2);
}

std::optional<std::vector<PathStep>> BaconGraph::lookup_path(const std::string& actor) const
{
    int v = actor_id(actor);
    if (v < 0)
        return std::nullopt;

    std::vector<int> ids;
    BFS::trace_path(parent_, v, ids);

    std::vector<PathStep> path;
    path.reserve(ids.size());
    for (int id : ids)
        path.push_back({graph_.kind(id), graph_.names[id]});
    return path;
}

std::optional<std::string> BaconGraph::bacon_path(const std::string& actor) const
{
    std::optional<std::vector<PathStep>> path = lookup_path(actor);
    if (!path)
        return std::nullopt;
    return render_path(*path);
}

} // namespace Bacon
