#pragma once

#include <stdexcept>
#include <string>

namespace fuzzscore
{

/**
 * @brief Thrown when input text is outside the scoring contract (malformed UTF-8).
 */
class InvalidTextError : public std::runtime_error
{
public:
    explicit InvalidTextError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace fuzzscore
