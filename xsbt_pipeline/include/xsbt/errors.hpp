#pragma once

#include <stdexcept>
#include <string>

namespace xsbt {

// Required input columns are missing or carry an unsupported type.
class InputShapeError : public std::runtime_error {
 public:
  explicit InputShapeError(const std::string& what)
      : std::runtime_error("input shape: " + what) {}
};

// Configuration could not be read or holds out-of-range parameters.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what)
      : std::runtime_error("config: " + what) {}
};

}  // namespace xsbt
