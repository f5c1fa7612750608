#pragma once

#include <stdexcept>
#include <string>

namespace claimscan {

// The monthly aggregate table was never produced; there is nothing to score.
class DataUnavailableError : public std::runtime_error {
public:
    explicit DataUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

// A report was requested for an entity the aggregates do not contain.
class UnknownEntityError : public std::runtime_error {
public:
    explicit UnknownEntityError(const std::string& entity_id)
        : std::runtime_error("No claims found for entity " + entity_id), entity_id_(entity_id) {}

    [[nodiscard]] auto entity_id() const -> const std::string& { return entity_id_; }

private:
    std::string entity_id_;
};

} // namespace claimscan
