#include "Records.h"
#include "BaconErrors.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace Bacon {

bool is_blank(const std::string& s)
{
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::optional<Record> parse_line(const std::string& line)
{
    std::string text = line;
    if (!text.empty() && text.back() == '\r')
        text.pop_back();

    for (NodeKind kind : {NodeKind::ACTOR, NodeKind::MOVIE}) {
        const std::string prefix = marker(kind);
        if (text.compare(0, prefix.size(), prefix) == 0)
            return Record{kind, text.substr(prefix.size())};
    }
    return std::nullopt;
}

void read_records(
    std::istream& in,
    const std::function<void(const Record&)>& sink,
    RecordStats* stats)
{
    RecordStats local;
    std::string line;
    while (std::getline(in, line)) {
        local.lines++;
        std::optional<Record> record = parse_line(line);
        if (!record) {
            local.skipped_lines++;
            continue;
        }
        if (record->kind == NodeKind::ACTOR)
            local.actor_records++;
        else
            local.movie_records++;
        sink(*record);
    }
    // getline sets failbit at end of input; badbit means the read broke.
    if (in.bad())
        throw InputError("Read failure after " + std::to_string(local.lines) + " lines");

    if (stats != nullptr)
        *stats = local;
}

void read_records(
    const std::string& path,
    const std::function<void(const Record&)>& sink,
    RecordStats* stats)
{
    if (is_blank(path))
        throw std::invalid_argument("File name can't be blank");

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        throw InputError("File not found: " + path);
    if (!std::filesystem::is_regular_file(path, ec))
        throw InputError("Not a regular file: " + path);

    std::ifstream file(path);
    if (!file)
        throw InputError("Cannot open file: " + path);

    spdlog::debug("Reading records from {}", path);
    try {
        read_records(file, sink, stats);
    } catch (const InputError& e) {
        throw InputError(path + ": " + e.what());
    }
}

} // namespace Bacon
