#pragma once

#include <istream>
#include <ostream>
#include <string>

#include "baconAPI.h"

namespace QueryShell {

// Instruction shown before every query.
inline std::string prompt(const std::string& reference_actor) {
    return "Input the name for the actor in the format \"" + reference_actor +
           "\". Press enter without providing a name to quit";
}

// Print the answer for a single actor name.
inline void answer(const Bacon::BaconGraph& graph, const std::string& name, std::ostream& out) {
    using Status = Bacon::DistanceResult::Status;
    Bacon::DistanceResult result = graph.lookup_distance(name);

    switch (result.status) {
    case Status::NOT_FOUND:
        out << "\"" << name << "\" not found\n";
        break;
    case Status::UNREACHABLE:
        out << "\"" << name << "\" is not connected to " << graph.reference_actor() << ".\n";
        break;
    case Status::REACHED:
        out << "\"" << name << "\" is " << result.bacon_number << " steps away from "
            << graph.reference_actor() << ". The Path is:\n";
        out << graph.bacon_path(name).value_or("") << "\n";
        break;
    }
}

// Read-query-print loop.  Ends on a blank line or end of input.
inline void run(const Bacon::BaconGraph& graph, std::istream& in, std::ostream& out) {
    out << prompt(graph.reference_actor()) << "\n";

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (Bacon::is_blank(line))
            break;

        out << "\n";
        answer(graph, line, out);
        out << "\n" << prompt(graph.reference_actor()) << "\n";
    }
    out << "Goodbye\n";
}

} // namespace QueryShell
