#pragma once

/**
 * @file augmentation.hpp
 * @brief Iterators that wrap another iterator and transform its batches.
 *
 * Every augmentation validates its per-name configuration against the
 * layout declared by the wrapped iterator when it is constructed and
 * throws IteratorValidationError on any mismatch. Once built it never
 * fails: the shapes of every batch follow from the validated layout.
 *
 * Augmentations draw from their own RandomState, independent of the
 * wrapped iterator, and can be stacked to any depth:
 *
 * @code
 * auto it = make_random_crop(make_pad(make_minibatches(data), {{"default", 2}}),
 *                            {{"default", {32, 32}}});
 * @endcode
 */

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "batchflow/config.hpp"
#include "batchflow/data_iterator.hpp"
#include "batchflow/errors.hpp"
#include "batchflow/random_state.hpp"
#include "batchflow/tensor_ops.hpp"
#include "batchflow/validation.hpp"

namespace batchflow {

/**
 * @brief Base class of all augmentations.
 *
 * Holds the wrapped iterator, the layout it yields after this
 * augmentation and the augmentation's RandomState. Subclasses only
 * implement apply(), which transforms one batch in place.
 */
class AugmentingIterator : public DataIterator {
  public:
    using Seed = RandomState::Seed;

    const DataLayout& layout() const override { return layout_; }
    const std::shared_ptr<DataIterator>& inner() const { return inner_; }
    RandomState& rnd() { return rnd_; }

  protected:
    AugmentingIterator(std::shared_ptr<DataIterator> inner, std::optional<Seed> seed)
        : inner_{std::move(inner)}, rnd_{seed} {
        if (!inner_)
            throw IteratorValidationError("cannot wrap a null iterator");
        layout_ = inner_->layout();
    }

    virtual void apply(NamedTensors& batch) = 0;

    std::unique_ptr<BatchStream> iterate(const Handler& handler, bool verbose) override {
        return std::make_unique<Stream>(*this, (*inner_)(handler, verbose));
    }

    std::shared_ptr<DataIterator> inner_;
    DataLayout layout_;
    RandomState rnd_;

  private:
    class Stream : public BatchStream {
      public:
        Stream(AugmentingIterator& owner, std::unique_ptr<BatchStream> inner)
            : owner_{&owner}, inner_{std::move(inner)} {}

        std::optional<NamedTensors> next() override {
            auto batch = inner_->next();
            if (batch)
                owner_->apply(*batch);
            return batch;
        }

      private:
        AugmentingIterator* owner_;
        std::unique_ptr<BatchStream> inner_;
    };
};

/**
 * @brief Adds Gaussian noise to numeric data.
 *
 * Each configured name gets its own standard deviation and, optionally,
 * its own mean (0 when no means are given). Float32 and Float64 data keep
 * their type; integer data is converted to Float64 before the noise is
 * added.
 */
class AddGaussianNoise : public AugmentingIterator {
  public:
    AddGaussianNoise(std::shared_ptr<DataIterator> inner, std::map<std::string, double> std_dict,
                     std::optional<std::map<std::string, double>> mean_dict = std::nullopt,
                     std::optional<Seed> seed = std::nullopt)
        : AugmentingIterator{std::move(inner), seed}, std_dict_{std::move(std_dict)} {
        if (mean_dict) {
            require_same_names(std_dict_, *mean_dict,
                               "means and standard deviations must be provided for the same "
                               "data names");
            mean_dict_ = std::move(*mean_dict);
        }
        for (const auto& entry : std_dict_) {
            require_name(layout_, entry.first);
            // Integer data cannot hold the noise and is yielded as Float64.
            auto& info = layout_.at(entry.first);
            if (!is_floating(info.dtype))
                info.dtype = Tensor::DType::Float64;
        }
    }

    const std::map<std::string, double>& std_dict() const { return std_dict_; }
    const std::map<std::string, double>& mean_dict() const { return mean_dict_; }

  protected:
    void apply(NamedTensors& batch) override {
        for (const auto& [name, stddev] : std_dict_) {
            auto it = mean_dict_.find(name);
            double mean = it == mean_dict_.end() ? 0.0 : it->second;
            Tensor& t = batch.at(name);
            if (!is_floating(t.dtype()))
                t = cast_to_float64(t);
            auto noise = rnd_.standard_normal(numel(t.shape()));
            add_scaled_noise(t, noise, stddev, mean);
        }
    }

  private:
    std::map<std::string, double> std_dict_;
    std::map<std::string, double> mean_dict_{};
};

/**
 * @brief Randomly flips images horizontally.
 *
 * One draw per name and batch decides whether the whole batch of that
 * name is reversed along its last dimension. Defaults to the "default"
 * data item with probability 0.5.
 */
class Flip : public AugmentingIterator {
  public:
    explicit Flip(std::shared_ptr<DataIterator> inner,
                  std::optional<std::map<std::string, double>> prob_dict = std::nullopt,
                  std::optional<Seed> seed = std::nullopt)
        : AugmentingIterator{std::move(inner), seed} {
        prob_dict_ = prob_dict ? std::move(*prob_dict)
                               : std::map<std::string, double>{
                                     {BATCHFLOW_DEFAULT_DATA_NAME,
                                      BATCHFLOW_DEFAULT_FLIP_PROBABILITY}};
        for (const auto& [name, prob] : prob_dict_) {
            require_name(layout_, name);
            if (!(prob >= 0.0 && prob <= 1.0))
                throw IteratorValidationError("Invalid probability " + std::to_string(prob) +
                                              " for " + name);
            require_image_data(layout_, name);
        }
    }

    const std::map<std::string, double>& prob_dict() const { return prob_dict_; }

  protected:
    void apply(NamedTensors& batch) override {
        for (const auto& [name, prob] : prob_dict_) {
            if (rnd_.random_sample() < prob) {
                Tensor& t = batch.at(name);
                t = flip_last_axis(t);
            }
        }
    }

  private:
    std::map<std::string, double> prob_dict_;
};

/**
 * @brief Pads images equally on all sides.
 *
 * Sequences of multi-channel images (T, B, C, H, W) become
 * (T, B, C, H + 2 * size, W + 2 * size). Zero padding is used unless a
 * value is given. The element type is kept.
 */
class Pad : public AugmentingIterator {
  public:
    Pad(std::shared_ptr<DataIterator> inner, std::map<std::string, std::size_t> size_dict,
        std::optional<std::map<std::string, double>> value_dict = std::nullopt,
        std::optional<Seed> seed = std::nullopt)
        : AugmentingIterator{std::move(inner), seed}, size_dict_{std::move(size_dict)} {
        if (value_dict) {
            require_same_names(size_dict_, *value_dict,
                               "padding sizes and values must be provided for the same data "
                               "names");
            value_dict_ = std::move(*value_dict);
        }
        for (const auto& [name, size] : size_dict_) {
            require_image_data(layout_, name);
            auto& shape = layout_.at(name).shape;
            shape[3] += 2 * size;
            shape[4] += 2 * size;
        }
    }

    const std::map<std::string, std::size_t>& size_dict() const { return size_dict_; }
    const std::map<std::string, double>& value_dict() const { return value_dict_; }

  protected:
    void apply(NamedTensors& batch) override {
        for (const auto& [name, size] : size_dict_) {
            auto it = value_dict_.find(name);
            double value = it == value_dict_.end() ? 0.0 : it->second;
            Tensor& t = batch.at(name);
            t = pad_spatial(t, size, value);
        }
    }

  private:
    std::map<std::string, std::size_t> size_dict_;
    std::map<std::string, double> value_dict_{};
};

/// Height and width of a crop window.
struct CropShape {
    std::size_t height{0};
    std::size_t width{0};
};

/**
 * @brief Randomly crops images.
 *
 * Every sample of a batch gets its own window, drawn uniformly among all
 * positions where the window fits. A sample keeps the same window across
 * all of its time steps and channels.
 */
class RandomCrop : public AugmentingIterator {
  public:
    RandomCrop(std::shared_ptr<DataIterator> inner, std::map<std::string, CropShape> shape_dict,
               std::optional<Seed> seed = std::nullopt)
        : AugmentingIterator{std::move(inner), seed}, shape_dict_{std::move(shape_dict)} {
        for (const auto& [name, crop] : shape_dict_) {
            require_image_data(layout_, name);
            auto& shape = layout_.at(name).shape;
            if (crop.height > shape[3])
                throw IteratorValidationError("Invalid crop height " +
                                              std::to_string(crop.height) + " for " + name +
                                              " of height " + std::to_string(shape[3]));
            if (crop.width > shape[4])
                throw IteratorValidationError("Invalid crop width " + std::to_string(crop.width) +
                                              " for " + name + " of width " +
                                              std::to_string(shape[4]));
            shape[3] = crop.height;
            shape[4] = crop.width;
        }
    }

    const std::map<std::string, CropShape>& shape_dict() const { return shape_dict_; }

  protected:
    void apply(NamedTensors& batch) override {
        for (const auto& [name, crop] : shape_dict_) {
            Tensor& t = batch.at(name);
            const auto& s = t.shape();
            const std::size_t batch_size = s[1];
            auto rows = rnd_.random_integers(0, s[3] - crop.height, batch_size);
            auto cols = rnd_.random_integers(0, s[4] - crop.width, batch_size);
            t = crop_images(t, crop.height, crop.width, rows, cols);
        }
    }

  private:
    std::map<std::string, CropShape> shape_dict_;
};

inline std::shared_ptr<DataIterator>
make_add_gaussian_noise(std::shared_ptr<DataIterator> inner, std::map<std::string, double> std_dict,
                        std::optional<std::map<std::string, double>> mean_dict = std::nullopt,
                        std::optional<RandomState::Seed> seed = std::nullopt) {
    return std::make_shared<AddGaussianNoise>(std::move(inner), std::move(std_dict),
                                              std::move(mean_dict), seed);
}

inline std::shared_ptr<DataIterator>
make_flip(std::shared_ptr<DataIterator> inner,
          std::optional<std::map<std::string, double>> prob_dict = std::nullopt,
          std::optional<RandomState::Seed> seed = std::nullopt) {
    return std::make_shared<Flip>(std::move(inner), std::move(prob_dict), seed);
}

inline std::shared_ptr<DataIterator>
make_pad(std::shared_ptr<DataIterator> inner, std::map<std::string, std::size_t> size_dict,
         std::optional<std::map<std::string, double>> value_dict = std::nullopt,
         std::optional<RandomState::Seed> seed = std::nullopt) {
    return std::make_shared<Pad>(std::move(inner), std::move(size_dict), std::move(value_dict),
                                 seed);
}

inline std::shared_ptr<DataIterator> make_random_crop(std::shared_ptr<DataIterator> inner,
                                                      std::map<std::string, CropShape> shape_dict,
                                                      std::optional<RandomState::Seed> seed =
                                                          std::nullopt) {
    return std::make_shared<RandomCrop>(std::move(inner), std::move(shape_dict), seed);
}

} // namespace batchflow
