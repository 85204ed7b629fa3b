#pragma once
#include <stdexcept>
#include <string>

// Grade outside AGAIN..EASY. Raised before any mutation.
class InvalidGradeError : public std::runtime_error {
public:
    explicit InvalidGradeError(const std::string& what) : std::runtime_error(what) {}
};

class InvalidConfigError : public std::runtime_error {
public:
    explicit InvalidConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Opaque persistence failure; never retried by the engine.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class ItemNotFoundError : public std::runtime_error {
public:
    explicit ItemNotFoundError(const std::string& id)
        : std::runtime_error("item not found: " + id), item_id(id) {}

    std::string item_id;
};
