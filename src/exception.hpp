#pragma once

#include <stdexcept>
#include <string>

class ApkmetaException : public std::runtime_error {
public:
    explicit ApkmetaException(const std::string& message)
        : std::runtime_error(message) {}
};

// Corrupt or incompatible APKINDEX / installed database.
class IndexParseError : public ApkmetaException {
public:
    explicit IndexParseError(const std::string& message)
        : ApkmetaException(message) {}
};

class RecipeParseError : public ApkmetaException {
public:
    explicit RecipeParseError(const std::string& message)
        : ApkmetaException(message) {}
};

class PackageNotFoundError : public ApkmetaException {
public:
    explicit PackageNotFoundError(const std::string& message)
        : ApkmetaException(message) {}
};

class DependencyNotFoundError : public ApkmetaException {
public:
    explicit DependencyNotFoundError(const std::string& message)
        : ApkmetaException(message) {}
};
