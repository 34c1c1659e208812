#pragma once
#include <stdexcept>
#include <string>

namespace juggl {

// The output destination rejected a write. Never retried.
class WriteError : public std::runtime_error {
public:
  explicit WriteError(const std::string& what) : std::runtime_error(what) {}
};

// Bad run parameters (seed, sizes, strategy, config keys).
class ParamError : public std::invalid_argument {
public:
  explicit ParamError(const std::string& what) : std::invalid_argument(what) {}
};

}
