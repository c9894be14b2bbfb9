#pragma once

/**
 * @file tensor_ops.hpp
 * @brief Byte level kernels used by the iterators.
 *
 * All helpers operate on row-major Tensor buffers and copy whole runs of
 * elements with memcpy wherever the layout allows it. None of them modify
 * their input; a new tensor is always returned, except for
 * add_scaled_noise() which is documented as in-place.
 */

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "batchflow/core.hpp"

namespace batchflow {

/** Write @p value converted to @p dt at @p dst. */
inline void store_scalar(std::byte* dst, Tensor::DType dt, double value) {
    switch (dt) {
    case Tensor::DType::Float32: {
        float v = static_cast<float>(value);
        std::memcpy(dst, &v, sizeof(v));
        break;
    }
    case Tensor::DType::Float64:
        std::memcpy(dst, &value, sizeof(value));
        break;
    case Tensor::DType::Int32: {
        std::int32_t v = static_cast<std::int32_t>(value);
        std::memcpy(dst, &v, sizeof(v));
        break;
    }
    case Tensor::DType::Int64: {
        std::int64_t v = static_cast<std::int64_t>(value);
        std::memcpy(dst, &v, sizeof(v));
        break;
    }
    case Tensor::DType::UInt8:
    default: {
        std::uint8_t v = static_cast<std::uint8_t>(value);
        std::memcpy(dst, &v, sizeof(v));
        break;
    }
    }
}

/** Read the element of type @p dt stored at @p src as a double. */
inline double load_scalar(const std::byte* src, Tensor::DType dt) {
    switch (dt) {
    case Tensor::DType::Float32: {
        float v;
        std::memcpy(&v, src, sizeof(v));
        return v;
    }
    case Tensor::DType::Float64: {
        double v;
        std::memcpy(&v, src, sizeof(v));
        return v;
    }
    case Tensor::DType::Int32: {
        std::int32_t v;
        std::memcpy(&v, src, sizeof(v));
        return static_cast<double>(v);
    }
    case Tensor::DType::Int64: {
        std::int64_t v;
        std::memcpy(&v, src, sizeof(v));
        return static_cast<double>(v);
    }
    case Tensor::DType::UInt8:
    default: {
        std::uint8_t v;
        std::memcpy(&v, src, sizeof(v));
        return static_cast<double>(v);
    }
    }
}

/** Convert any tensor to Float64, keeping its shape. */
inline Tensor cast_to_float64(const Tensor& t) {
    if (t.dtype() == Tensor::DType::Float64)
        return t;
    const std::size_t elem_size = dtype_size(t.dtype());
    const std::size_t count = t.data().size() / elem_size;
    std::vector<std::byte> data(count * sizeof(double));
    auto* dst = reinterpret_cast<double*>(data.data());
    for (std::size_t i = 0; i < count; ++i)
        dst[i] = load_scalar(t.data().data() + i * elem_size, t.dtype());
    return Tensor{Tensor::DType::Float64, t.shape(), std::move(data)};
}

/** Tensor of the given type and shape with every element set to @p value. */
inline Tensor full(Tensor::DType dt, Tensor::Shape shape, double value) {
    std::size_t elem_size = dtype_size(dt);
    std::size_t count = numel(shape);
    std::vector<std::byte> data(count * elem_size);
    // Encode the value once and replicate its bytes over the buffer.
    if (count > 0) {
        store_scalar(data.data(), dt, value);
        for (std::size_t i = 1; i < count; ++i)
            std::memcpy(data.data() + i * elem_size, data.data(), elem_size);
    }
    return Tensor{dt, std::move(shape), std::move(data)};
}

/**
 * @brief Slice a (T, B, ...) tensor to samples [begin, end) along axis 1.
 *
 * @p end is clamped to B so the last minibatch may be shorter than
 * requested. The time axis and all feature axes are kept intact.
 */
inline Tensor slice_samples(const Tensor& t, std::size_t begin, std::size_t end) {
    if (t.rank() < 2)
        throw std::invalid_argument("slice_samples: tensor must have at least 2 dimensions");
    const std::size_t time = t.shape()[0];
    const std::size_t batch = t.shape()[1];
    end = std::min(end, batch);
    begin = std::min(begin, end);

    std::size_t inner = 1;
    for (std::size_t i = 2; i < t.rank(); ++i)
        inner *= t.shape()[i];
    const std::size_t elem_size = dtype_size(t.dtype());
    const std::size_t sample_bytes = inner * elem_size;
    const std::size_t count = end - begin;

    Tensor::Shape shape = t.shape();
    shape[1] = count;
    std::vector<std::byte> data(time * count * sample_bytes);
    // Samples of one time step are contiguous, so each step is a single copy.
    for (std::size_t s = 0; s < time; ++s) {
        const std::byte* src = t.data().data() + (s * batch + begin) * sample_bytes;
        std::byte* dst = data.data() + s * count * sample_bytes;
        if (count > 0)
            std::memcpy(dst, src, count * sample_bytes);
    }
    return Tensor{t.dtype(), std::move(shape), std::move(data)};
}

/** Reverse a tensor along its last dimension (horizontal image flip). */
inline Tensor flip_last_axis(const Tensor& t) {
    Tensor out = t;
    if (t.shape().empty() || t.shape().back() < 2)
        return out;
    const std::size_t elem_size = dtype_size(t.dtype());
    const std::size_t row_bytes = t.shape().back() * elem_size;
    const std::size_t rows = out.data().size() / row_bytes;
    std::vector<std::byte> scratch(elem_size);
    // Swap mirrored elements pairwise inside every row of the copy.
    for (std::size_t r = 0; r < rows; ++r) {
        std::byte* lo = out.data().data() + r * row_bytes;
        std::byte* hi = lo + row_bytes - elem_size;
        for (; lo < hi; lo += elem_size, hi -= elem_size) {
            std::memcpy(scratch.data(), lo, elem_size);
            std::memcpy(lo, hi, elem_size);
            std::memcpy(hi, scratch.data(), elem_size);
        }
    }
    return out;
}

/**
 * @brief Pad the two spatial axes of a (T, B, C, H, W) tensor.
 *
 * The result has shape (T, B, C, H + 2 * size, W + 2 * size), is filled
 * with @p value and holds the input in its centred interior.
 */
inline Tensor pad_spatial(const Tensor& t, std::size_t size, double value) {
    if (t.rank() != 5)
        throw std::invalid_argument("pad_spatial: expected a 5D tensor, got " +
                                    shape_to_string(t.shape()));
    const std::size_t h = t.shape()[3];
    const std::size_t w = t.shape()[4];
    const std::size_t out_h = h + 2 * size;
    const std::size_t out_w = w + 2 * size;
    const std::size_t planes = t.shape()[0] * t.shape()[1] * t.shape()[2];
    const std::size_t elem_size = dtype_size(t.dtype());

    // Start from a tensor holding only the padding value.
    Tensor out = full(t.dtype(), {t.shape()[0], t.shape()[1], t.shape()[2], out_h, out_w}, value);
    if (w == 0)
        return out;
    // Copy each image row into the interior, offset by size rows and columns.
    for (std::size_t p = 0; p < planes; ++p) {
        const std::byte* src_base = t.data().data() + p * h * w * elem_size;
        std::byte* dst_base = out.data().data() + p * out_h * out_w * elem_size;
        for (std::size_t y = 0; y < h; ++y) {
            const std::byte* src = src_base + y * w * elem_size;
            std::byte* dst = dst_base + ((y + size) * out_w + size) * elem_size;
            std::memcpy(dst, src, w * elem_size);
        }
    }
    return out;
}

/**
 * @brief Crop one window per sample out of a (T, B, C, H, W) tensor.
 *
 * Sample @c b uses the window whose top left corner is
 * (row_offsets[b], col_offsets[b]) for every time step and channel. The
 * output has shape (T, B, C, crop_h, crop_w) and keeps time, sample and
 * channel order unchanged.
 */
inline Tensor crop_images(const Tensor& t, std::size_t crop_h, std::size_t crop_w,
                          const std::vector<std::size_t>& row_offsets,
                          const std::vector<std::size_t>& col_offsets) {
    if (t.rank() != 5)
        throw std::invalid_argument("crop_images: expected a 5D tensor, got " +
                                    shape_to_string(t.shape()));
    const std::size_t time = t.shape()[0];
    const std::size_t batch = t.shape()[1];
    const std::size_t channels = t.shape()[2];
    const std::size_t h = t.shape()[3];
    const std::size_t w = t.shape()[4];
    if (row_offsets.size() != batch || col_offsets.size() != batch)
        throw std::invalid_argument("crop_images: need one row and column offset per sample");
    for (std::size_t b = 0; b < batch; ++b) {
        if (row_offsets[b] + crop_h > h || col_offsets[b] + crop_w > w) {
            std::ostringstream msg;
            msg << "crop_images: window (" << row_offsets[b] << ", " << col_offsets[b] << ") + ("
                << crop_h << ", " << crop_w << ") exceeds image " << h << "x" << w;
            throw std::invalid_argument(msg.str());
        }
    }

    // Every offset pair was checked above, so the copies below stay in bounds.
    const std::size_t elem_size = dtype_size(t.dtype());
    Tensor::Shape shape{time, batch, channels, crop_h, crop_w};
    std::vector<std::byte> data(numel(shape) * elem_size);
    if (data.empty())
        return Tensor{t.dtype(), std::move(shape), std::move(data)};
    // The window depends on the sample only; time steps and channels share it.
    for (std::size_t s = 0; s < time; ++s) {
        for (std::size_t b = 0; b < batch; ++b) {
            const std::size_t off_h = row_offsets[b];
            const std::size_t off_w = col_offsets[b];
            for (std::size_t c = 0; c < channels; ++c) {
                const std::size_t plane = (s * batch + b) * channels + c;
                const std::byte* src_base = t.data().data() + plane * h * w * elem_size;
                std::byte* dst_base = data.data() + plane * crop_h * crop_w * elem_size;
                for (std::size_t y = 0; y < crop_h; ++y) {
                    const std::byte* src = src_base + ((off_h + y) * w + off_w) * elem_size;
                    std::byte* dst = dst_base + y * crop_w * elem_size;
                    std::memcpy(dst, src, crop_w * elem_size);
                }
            }
        }
    }
    return Tensor{t.dtype(), std::move(shape), std::move(data)};
}

/**
 * @brief In-place: t += stddev * noise + mean.
 *
 * @p noise must hold one standard normal sample per element. Only
 * floating point tensors are supported.
 */
inline void add_scaled_noise(Tensor& t, const std::vector<double>& noise, double stddev,
                             double mean) {
    if (!is_floating(t.dtype()))
        throw std::invalid_argument(std::string("add_scaled_noise: unsupported dtype ") +
                                    dtype_name(t.dtype()));
    const std::size_t count = t.data().size() / dtype_size(t.dtype());
    if (noise.size() != count)
        throw std::invalid_argument("add_scaled_noise: noise size does not match tensor");
    // Accumulate in double and round once for Float32 data.
    if (t.dtype() == Tensor::DType::Float32) {
        float* dst = reinterpret_cast<float*>(t.data().data());
        for (std::size_t i = 0; i < count; ++i)
            dst[i] = static_cast<float>(dst[i] + stddev * noise[i] + mean);
    } else {
        double* dst = reinterpret_cast<double*>(t.data().data());
        for (std::size_t i = 0; i < count; ++i)
            dst[i] = dst[i] + stddev * noise[i] + mean;
    }
}

} // namespace batchflow
