#pragma once
#include <stdexcept>
#include <string>

namespace Bacon {

/**
 * @brief Raised when the input data file is missing, is not a regular
 *        file, or cannot be read to the end.
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Raised when the loaded data does not contain the reference actor.
 *
 * Construction of the graph is abandoned; no partially usable graph exists.
 */
class NoReferenceActorError : public std::runtime_error {
public:
    explicit NoReferenceActorError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace Bacon
