//
// Interactive Bacon-number lookup.
// Loads an actor/movie data file, computes every actor's distance to the
// reference actor, then answers name queries read from stdin.
//
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

#include "baconAPI.h"
#include "log_levels.h"
#include "query_shell.h"

// ── CLI ─────────────────────────────────────────────────────────────────
struct CLIArgs
{
    std::string input;
    std::string reference = "Bacon, Kevin (I)";
    int expected_actors   = 3000;
    int expected_movies   = 1000;
    std::string log_level = "info";

    CLIArgs(int argc, char* argv[])
    {
        CLI::App app{"The Bacon Game"};
        app.add_option("-i,--input", input, "actor/movie data file (<a>/<t> line format)")->required();
        app.add_option("-r,--reference", reference, "reference actor (default: \"Bacon, Kevin (I)\")");
        app.add_option("--expected_actors", expected_actors, "expected number of actors (default: 3000)");
        app.add_option("--expected_movies", expected_movies, "expected number of movies (default: 1000)");
        app.add_option("--log_level", log_level, "trace, debug, info, warn, error, critical or off")
            ->check(CLI::IsMember(LogLevels::names()));

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }
};

// ── main ────────────────────────────────────────────────────────────────
int main(int argc, char* argv[])
{
    CLIArgs args(argc, argv);
    spdlog::set_level(LogLevels::parse(args.log_level));

    Bacon::BaconOptions opt;
    opt.reference_actor = args.reference;
    opt.expected_number_of_actors = args.expected_actors;
    opt.expected_number_of_movies = args.expected_movies;

    try {
        Bacon::BaconGraph graph(args.input, &opt);
        QueryShell::run(graph, std::cin, std::cout);
    } catch (const Bacon::InputError& e) {
        spdlog::error("Could not load data: {}", e.what());
        return 1;
    } catch (const Bacon::NoReferenceActorError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid argument: {}", e.what());
        return 1;
    }
    return 0;
}
