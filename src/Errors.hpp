#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class for every error DropSorter raises on purpose.
class DropSorterError : public std::runtime_error {
public:
    explicit DropSorterError(const std::string& message) : std::runtime_error(message) {}
};

// No workspace has been chosen, or the chosen one no longer exists.
class NoLocationFound : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

// A path that must be a usable directory is not one.
class InvalidDirectory : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

// A persisted category file could not be read or parsed.
class ConfigReadError : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

// A category file could not be written.
class ConfigWriteError : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

class DuplicateExtension : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

class DuplicateCategory : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

class UnknownCategory : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

// The fallback category cannot be removed.
class ProtectedCategory : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

class EmptyExtension : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

class EmptyCategoryName : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

class InvalidExtensionFormat : public DropSorterError {
public:
    using DropSorterError::DropSorterError;
};

#endif
