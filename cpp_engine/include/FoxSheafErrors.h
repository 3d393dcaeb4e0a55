#pragma once

#include <stdexcept>
#include <string>

namespace foxsheaf {

// Base for every error raised by the fusion engine.
class FoxSheafError : public std::runtime_error {
public:
    explicit FoxSheafError(const std::string& what) : std::runtime_error(what) {}
};

// Poset cycle, unknown/duplicate cell, or mutation of a sealed complex.
class StructureError : public FoxSheafError {
public:
    explicit StructureError(const std::string& what) : FoxSheafError("StructureError: " + what) {}
};

// A value that is not a member of the stalk it is evaluated against.
class DomainError : public FoxSheafError {
public:
    explicit DomainError(const std::string& what) : FoxSheafError("DomainError: " + what) {}
};

// Radius requested on an assignment with at least one empty cell.
class IncompleteAssignmentError : public FoxSheafError {
public:
    explicit IncompleteAssignmentError(const std::string& what)
        : FoxSheafError("IncompleteAssignmentError: " + what) {}
};

} // namespace foxsheaf
