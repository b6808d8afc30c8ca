// errors.h - Exception types raised by the delta engine

#pragma once

#include <deep_delta/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace deep_delta {

/// Base class for engine failures that indicate a broken contract
class DEEP_DELTA_API delta_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A nested or polymorphic document no longer matches the target, or a payload
/// does not hold the member's type, and no replacement payload was supplied.
class DEEP_DELTA_API delta_type_mismatch : public delta_error {
public:
    using delta_error::delta_error;
};

/// No registry entry and no operator== for a type reached during comparison
class DEEP_DELTA_API type_not_registered : public delta_error {
public:
    explicit type_not_registered(const std::string& type_name)
        : delta_error("deep_delta: type '" + type_name + "' is not registered")
        , type_name_(type_name) {}

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

/// Sequence op index outside the current target length
class DEEP_DELTA_API delta_index_out_of_range : public std::out_of_range {
public:
    delta_index_out_of_range(int index, std::size_t size)
        : std::out_of_range("deep_delta: sequence index " + std::to_string(index) +
                            " out of range (size " + std::to_string(size) + ")")
        , index_(index)
        , size_(size) {}

    [[nodiscard]] int index() const noexcept { return index_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    int index_;
    std::size_t size_;
};

} // namespace deep_delta
