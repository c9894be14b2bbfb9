#pragma once

#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "batchflow/core.hpp"
#include "batchflow/errors.hpp"

namespace batchflow {

/// True when @c T exposes a shape() query returning its per-axis extents.
template <typename T, typename = void> struct has_shape : std::false_type {};

template <typename T>
struct has_shape<T, std::void_t<decltype(std::declval<const T&>().shape().size()),
                                decltype(std::declval<const T&>().shape()[0])>>
    : std::true_type {};

template <typename T> inline constexpr bool has_shape_v = has_shape<T>::value;

namespace detail {

template <typename Map> std::string format_extents(const Map& values) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& [name, v] : values) {
        if (!first)
            out << ", ";
        out << name << ": " << v;
        first = false;
    }
    out << "}";
    return out.str();
}

template <typename Map> std::string format_keys(const Map& values) {
    std::string out = "[";
    bool first = true;
    for (const auto& entry : values) {
        if (!first)
            out += ", ";
        out += entry.first;
        first = false;
    }
    return out + "]";
}

} // namespace detail

/**
 * @brief Validate a mapping of name -> array and return its sample count.
 *
 * Every array must have at least three dimensions (time, sample, ...). All
 * arrays must agree on the time extent (axis 0) and on the sample extent
 * (axis 1). Arrays without any shape are reported as having the wrong
 * type. The common sample extent is returned.
 *
 * Works with any mapping whose values provide shape().
 */
template <typename NamedArrays> std::size_t check_data_format(const NamedArrays& named) {
    using Array = typename NamedArrays::mapped_type;
    static_assert(has_shape_v<Array>, "pipeline arrays must provide a shape() query");

    if (named.empty())
        throw IteratorValidationError("at least one named data item is required");

    std::map<std::string, std::size_t> nr_sequences;
    std::map<std::string, std::size_t> nr_timesteps;
    for (const auto& [name, data] : named) {
        const auto& shape = data.shape();
        if (shape.size() == 0)
            throw IteratorValidationError(name + " has a wrong type. (no shape)");
        if (shape.size() < 3)
            throw IteratorValidationError(
                "All inputs have to have at least 3 dimensions, where the first two are "
                "time_size and batch_size. " +
                name + " has " + std::to_string(shape.size()));
        nr_sequences[name] = shape[1];
        nr_timesteps[name] = shape[0];
    }

    auto differs = [](const std::map<std::string, std::size_t>& m) {
        for (const auto& entry : m)
            if (entry.second != m.begin()->second)
                return true;
        return false;
    };
    if (differs(nr_sequences))
        throw IteratorValidationError(
            "The number of sequences of all inputs must be equal, but got " +
            detail::format_extents(nr_sequences));
    if (differs(nr_timesteps))
        throw IteratorValidationError(
            "The number of time steps of all inputs must be equal, but got " +
            detail::format_extents(nr_timesteps));

    return nr_sequences.begin()->second;
}

/**
 * @brief Require every byte buffer to match the element type and shape of its tensor.
 *
 * Run once when a dataset is handed to an iterator. The kernels trust the
 * shape afterwards and copy whole rows without bounds checks.
 */
inline void check_buffer_sizes(const NamedTensors& named) {
    for (const auto& [name, t] : named) {
        const std::size_t expected = numel(t.shape()) * dtype_size(t.dtype());
        if (t.data().size() != expected)
            throw IteratorValidationError(name + " holds " + std::to_string(t.data().size()) +
                                          " bytes but " + dtype_name(t.dtype()) +
                                          shape_to_string(t.shape()) + " needs " +
                                          std::to_string(expected));
    }
}

/** Look up @p name in the layout declared by an inner iterator. */
inline const TensorInfo& require_name(const DataLayout& layout, const std::string& name) {
    auto it = layout.find(name);
    if (it == layout.end())
        throw IteratorValidationError("key " + name +
                                      " is not present in iterator. Available keys: " +
                                      detail::format_keys(layout));
    return it->second;
}

/** Look up @p name and require it to be a (T, B, C, H, W) image sequence. */
inline const TensorInfo& require_image_data(const DataLayout& layout, const std::string& name) {
    const auto& info = require_name(layout, name);
    if (info.shape.size() != 5)
        throw IteratorValidationError("Only 5D data is supported, but " + name + " has shape " +
                                      shape_to_string(info.shape));
    return info;
}

/** Throw unless both configuration maps name exactly the same data items. */
template <typename A, typename B>
void require_same_names(const A& a, const B& b, const std::string& message) {
    bool same = a.size() == b.size();
    for (auto ia = a.begin(), ib = b.begin(); same && ia != a.end(); ++ia, ++ib)
        same = ia->first == ib->first;
    if (!same)
        throw IteratorValidationError(message + ": " + detail::format_keys(a) + " vs " +
                                      detail::format_keys(b));
}

} // namespace batchflow
