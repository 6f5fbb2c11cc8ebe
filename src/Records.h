#pragma once
#include <functional>
#include <istream>
#include <optional>
#include <string>

#include "Graph.h"

/**
 * @brief Line-oriented reader for the actor/movie data format.
 *
 * @par Format
 * | Line prefix | Meaning                                           |
 * |-------------|---------------------------------------------------|
 * | "<a>"       | Declares an actor; the rest of the line is a name |
 * | "<t>"       | The current actor appeared in the titled movie    |
 * | other       | Ignored                                           |
 */
namespace Bacon {

/**
 * @brief A tagged input line with its marker stripped.
 */
struct Record {
    NodeKind kind;     ///< ACTOR for "<a>" lines, MOVIE for "<t>" lines.
    std::string text;  ///< Actor display name or movie title.
};

/**
 * @brief Counters collected while reading a record stream.
 */
struct RecordStats {
    int lines = 0;          ///< Number of lines read.
    int actor_records = 0;  ///< Lines that carried the actor marker.
    int movie_records = 0;  ///< Lines that carried the movie marker.
    int skipped_lines = 0;  ///< Lines with neither marker.
};

/// True when @p s is empty or consists only of whitespace.
bool is_blank(const std::string& s);

/**
 * @brief Parse one input line.
 *
 * A trailing carriage return is dropped first so that CRLF files read
 * like LF files.  Marker matching is exact and case-sensitive.
 *
 * @param line  A single line without its terminating newline.
 * @return The record, or std::nullopt if the line carries no marker.
 */
std::optional<Record> parse_line(const std::string& line);

/**
 * @brief Read every record from a stream, in order.
 *
 * @param in          Source stream.
 * @param sink        Called once per record.
 * @param[out] stats  Optional counters; overwritten when non-null.
 * @throws InputError if the stream fails for a reason other than
 *         reaching end of input.
 */
void read_records(
    std::istream& in,
    const std::function<void(const Record&)>& sink,
    RecordStats* stats = nullptr);

/**
 * @brief Read every record from a data file, in order.
 *
 * @param path        Path of the data file.
 * @param sink        Called once per record.
 * @param[out] stats  Optional counters; overwritten when non-null.
 * @throws std::invalid_argument if @p path is blank.
 * @throws InputError if the file does not exist, is not a regular file,
 *         or cannot be read.
 */
void read_records(
    const std::string& path,
    const std::function<void(const Record&)>& sink,
    RecordStats* stats = nullptr);

} // namespace Bacon
