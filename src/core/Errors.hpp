#pragma once
#include <stdexcept>
#include <string>

namespace ipe {

// Anything that went wrong talking to SQLite.
class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Storage unreachable or corrupt while creating the schema. Fatal at startup.
class InitError : public StoreError {
public:
  using StoreError::StoreError;
};

class WriteError : public StoreError {
public:
  using StoreError::StoreError;
};

class ReadError : public StoreError {
public:
  using StoreError::StoreError;
};

class NotInitializedError : public StoreError {
public:
  NotInitializedError() : StoreError("store not initialized") {}
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Rejected ingestion input. Returned by value, never thrown.
struct ValidationError {
  std::string field;
  std::string message;
};

} // namespace ipe
