#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace batchflow {

/** Runtime tensor holding arbitrary shaped, row-major data. */
class Tensor {
  public:
    /// Supported element types.
    enum class DType { Float32, Float64, Int32, Int64, UInt8 };

    using Shape = std::vector<std::size_t>;

    Tensor() = default;
    Tensor(DType t, Shape s, std::vector<std::byte> d = {})
        : type_{t}, shape_{std::move(s)}, data_{std::move(d)} {}
    Tensor(const Tensor& other) = default;
    Tensor(Tensor&& other) noexcept = default;
    Tensor& operator=(const Tensor& other) = default;
    Tensor& operator=(Tensor&& other) noexcept = default;

    const Shape& shape() const { return shape_; }
    std::size_t rank() const { return shape_.size(); }
    DType dtype() const { return type_; }

    const std::vector<std::byte>& data() const { return data_; }
    std::vector<std::byte>& data() { return data_; }

    bool operator==(const Tensor& other) const {
        return type_ == other.type_ && shape_ == other.shape_ && data_ == other.data_;
    }
    bool operator!=(const Tensor& other) const { return !(*this == other); }

  private:
    DType type_{DType::Float32};
    Shape shape_{};
    std::vector<std::byte> data_{};
};

/** Element type and shape of a tensor, without its data. */
struct TensorInfo {
    Tensor::DType dtype{Tensor::DType::Float32};
    Tensor::Shape shape{};
};

/// A batch: data name -> tensor. Every entry shares the (T, B) leading extents.
using NamedTensors = std::map<std::string, Tensor>;

/// The layout an iterator declares for the data it yields.
using DataLayout = std::map<std::string, TensorInfo>;

/**
 * @brief Opaque compute backend handle.
 *
 * Accepted by every iterator so pipelines can be driven by the same call
 * the network uses. The iterators never inspect it.
 */
class Handler {
  public:
    virtual ~Handler() = default;
};

/** Return the size in bytes of a single element for the given type. */
inline std::size_t dtype_size(Tensor::DType dt) {
    switch (dt) {
    case Tensor::DType::Float32:
    case Tensor::DType::Int32:
        return 4;
    case Tensor::DType::Float64:
    case Tensor::DType::Int64:
        return 8;
    case Tensor::DType::UInt8:
    default:
        return 1;
    }
}

inline const char* dtype_name(Tensor::DType dt) {
    switch (dt) {
    case Tensor::DType::Float32:
        return "f32";
    case Tensor::DType::Float64:
        return "f64";
    case Tensor::DType::Int32:
        return "i32";
    case Tensor::DType::Int64:
        return "i64";
    case Tensor::DType::UInt8:
    default:
        return "u8";
    }
}

inline bool is_floating(Tensor::DType dt) {
    return dt == Tensor::DType::Float32 || dt == Tensor::DType::Float64;
}

inline std::size_t numel(const Tensor::Shape& s) {
    std::size_t n = 1;
    for (auto d : s)
        n *= d;
    return n;
}

inline std::string shape_to_string(const Tensor::Shape& s) {
    std::string out = "[";
    for (std::size_t i = 0; i < s.size(); ++i) {
        out += std::to_string(s[i]);
        if (i + 1 < s.size())
            out += ",";
    }
    out += "]";
    return out;
}

inline TensorInfo info_of(const Tensor& t) { return TensorInfo{t.dtype(), t.shape()}; }

inline DataLayout layout_of(const NamedTensors& named) {
    DataLayout layout;
    for (const auto& [name, t] : named)
        layout.emplace(name, info_of(t));
    return layout;
}

} // namespace batchflow
