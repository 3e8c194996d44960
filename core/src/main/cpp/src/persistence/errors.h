/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Typed failures raised by the storage layer. Every error reaches the
 * immediate caller; nothing in the engine retries.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace pathstore {
namespace persist {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Sizing metadata or schema requested twice with incompatible values,
// or two features declaring the same variable.
class SchemaConflictError : public StoreError {
public:
    explicit SchemaConflictError(const std::string& what) : StoreError(what) {}
};

// Index was never committed to the store.
class RecordNotFoundError : public StoreError {
public:
    RecordNotFoundError(const std::string& store, uint64_t index)
        : StoreError("record " + std::to_string(index) + " not found in store '" + store + "'"),
          store_(store), index_(index) {}

    const std::string& store() const noexcept { return store_; }
    uint64_t index() const noexcept { return index_; }

private:
    std::string store_;
    uint64_t index_;
};

// Class mismatch, use before initialization, or a violated pairing invariant.
class InconsistentStateError : public StoreError {
public:
    explicit InconsistentStateError(const std::string& what) : StoreError(what) {}
};

// Registry lookup for a class or feature nobody registered.
class UnknownClassError : public StoreError {
public:
    explicit UnknownClassError(const std::string& name)
        : StoreError("no store or descriptor registered for '" + name + "'"), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

// Rejected at record construction (non-finite values, wrong shape).
class InvalidValueError : public StoreError {
public:
    explicit InvalidValueError(const std::string& what) : StoreError(what) {}
};

// Underlying file could not be opened, read, written, or failed validation.
class StorageIOError : public StoreError {
public:
    explicit StorageIOError(const std::string& what) : StoreError(what) {}
};

} // namespace persist
} // namespace pathstore
