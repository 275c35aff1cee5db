#pragma once

#include <stdexcept>
#include <string>

// Rejected at a mutation boundary; state is left unchanged.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// A collaborator call failed or timed out.
class CollaboratorUnavailable : public std::runtime_error {
public:
    explicit CollaboratorUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class RateLimited : public CollaboratorUnavailable {
public:
    explicit RateLimited(const std::string& what) : CollaboratorUnavailable(what) {}
};
