#pragma once

#include <stdexcept>
#include <string>

namespace batchflow {

/**
 * @brief Raised when an iterator or its configuration violates the data contract.
 *
 * This is the only error the pipeline reports. It is always thrown while an
 * iterator is being constructed so a pipeline that was built successfully
 * never fails mid epoch.
 */
class IteratorValidationError : public std::runtime_error {
  public:
    explicit IteratorValidationError(const std::string& what) : std::runtime_error{what} {}
};

} // namespace batchflow
