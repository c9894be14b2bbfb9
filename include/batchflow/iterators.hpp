#pragma once

/**
 * @file iterators.hpp
 * @brief Base iterators that walk over an in-memory dataset.
 *
 * The dataset is a set of named tensors laid out as (T, B, ...) where T is
 * the number of time steps and B the number of sequences. Its format is
 * checked once on construction and the tensors are never modified.
 *
 *   - Undivided:   the whole dataset as a single batch
 *   - Online:      one sequence per batch
 *   - Minibatches: contiguous blocks of batch_size sequences
 */

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <vector>

#include "batchflow/config.hpp"
#include "batchflow/data_iterator.hpp"
#include "batchflow/errors.hpp"
#include "batchflow/progress.hpp"
#include "batchflow/random_state.hpp"
#include "batchflow/tensor_ops.hpp"
#include "batchflow/validation.hpp"

namespace batchflow {

/** Options shared by the sequence iterators. */
struct OnlineOptions {
    /** Visit the sequences in a random order. */
    bool shuffle = true;
    /** Force the progress bar on or off. Unset defers to the caller's flag. */
    std::optional<bool> verbose{};
    /** Seed of the iterator's RandomState. Unset draws one from std::random_device. */
    std::optional<RandomState::Seed> seed{};
    /** Destination of the progress bar. */
    std::ostream* out = &std::cout;
};

/** Options for Minibatches. */
struct MinibatchOptions : OnlineOptions {
    /** Number of sequences per batch. The last batch may be smaller. */
    std::size_t batch_size = BATCHFLOW_DEFAULT_BATCH_SIZE;
};

/** Processes the entire data in one block (only one iteration). */
class Undivided : public DataIterator {
  public:
    explicit Undivided(NamedTensors named_data)
        : data_{std::move(named_data)}, layout_{layout_of(data_)} {
        check_data_format(data_);
        check_buffer_sizes(data_);
        for (const auto& entry : data_)
            total_size_ += numel(entry.second.shape());
    }

    const DataLayout& layout() const override { return layout_; }
    const NamedTensors& data() const { return data_; }

    /// Number of scalars in the whole dataset.
    std::size_t total_size() const { return total_size_; }

  protected:
    std::unique_ptr<BatchStream> iterate(const Handler&, bool) override {
        return std::make_unique<Stream>(data_);
    }

  private:
    class Stream : public BatchStream {
      public:
        explicit Stream(const NamedTensors& data) : data_{data} {}

        std::optional<NamedTensors> next() override {
            if (done_)
                return std::nullopt;
            done_ = true;
            return data_;
        }

      private:
        const NamedTensors& data_;
        bool done_{false};
    };

    NamedTensors data_;
    DataLayout layout_;
    std::size_t total_size_{0};
};

/**
 * @brief Common implementation of Online and Minibatches.
 *
 * Splits the sequence axis into chunks of chunk_size() sequences. The
 * chunk order is fixed on the first pull of a stream, shuffled with the
 * iterator's own RandomState when requested; the sequences inside a chunk
 * always keep their order. Progress is reported in sequences.
 */
class SequenceIterator : public DataIterator {
  public:
    const DataLayout& layout() const override { return layout_; }
    const NamedTensors& data() const { return data_; }

    /// Number of sequences (the common B extent).
    std::size_t nr_sequences() const { return nr_sequences_; }

    /// Number of batches one pass yields: ceil(nr_sequences / chunk_size).
    std::size_t nr_batches() const {
        // Written without nr_sequences + chunk_size so huge batch sizes cannot wrap.
        return nr_sequences_ / chunk_size_ + (nr_sequences_ % chunk_size_ != 0 ? 1 : 0);
    }

    bool shuffle() const { return options_.shuffle; }
    RandomState& rnd() { return rnd_; }

  protected:
    SequenceIterator(NamedTensors named_data, const OnlineOptions& options, std::size_t chunk)
        : data_{std::move(named_data)}, layout_{layout_of(data_)}, options_{options},
          rnd_{options.seed}, chunk_size_{chunk} {
        if (chunk_size_ == 0)
            throw IteratorValidationError("batch_size must be at least 1");
        nr_sequences_ = check_data_format(data_);
        check_buffer_sizes(data_);
    }

    std::size_t chunk_size() const { return chunk_size_; }

    /// Scalars contained in one sequence of every named tensor.
    std::size_t sequence_size() const {
        std::size_t total = 0;
        for (const auto& entry : data_) {
            const auto& s = entry.second.shape();
            std::size_t features = 1;
            for (std::size_t i = 2; i < s.size(); ++i)
                features *= s[i];
            total += s[0] * features;
        }
        return total;
    }

    std::unique_ptr<BatchStream> iterate(const Handler&, bool verbose) override {
        bool show = options_.verbose ? *options_.verbose : verbose;
        return std::make_unique<Stream>(*this, make_progress(show, nr_sequences_));
    }

  private:
    class Stream : public BatchStream {
      public:
        Stream(SequenceIterator& owner, std::unique_ptr<ProgressIndicator> progress)
            : owner_{&owner}, progress_{std::move(progress)} {}

        std::optional<NamedTensors> next() override {
            if (finished_)
                return std::nullopt;
            if (!started_) {
                started_ = true;
                print(progress_->start());
                // The chunk order is fixed on the first pull.
                order_.resize(owner_->nr_batches());
                for (std::size_t i = 0; i < order_.size(); ++i)
                    order_[i] = i;
                if (owner_->options_.shuffle)
                    owner_->rnd_.shuffle(order_);
            } else {
                // Report the batch handed out by the previous pull as consumed.
                print(progress_->advance(consumed()));
            }
            if (position_ >= order_.size()) {
                finished_ = true;
                return std::nullopt;
            }
            // Only the last chunk can be short; the slice is clamped to the data.
            const std::size_t chunk = owner_->chunk_size_;
            const std::size_t begin = order_[position_++] * chunk;
            const std::size_t end = begin + std::min(chunk, owner_->nr_sequences_ - begin);
            NamedTensors batch;
            for (const auto& [name, t] : owner_->data_)
                batch.emplace(name, slice_samples(t, begin, end));
            return batch;
        }

      private:
        // Sequences handed out so far, counting every chunk as full. Saturates
        // at the number of sequences when the product would not fit.
        std::size_t consumed() const {
            const std::size_t chunk = owner_->chunk_size_;
            if (position_ > std::numeric_limits<std::size_t>::max() / chunk)
                return owner_->nr_sequences_;
            return position_ * chunk;
        }

        void print(const std::string& text) {
            std::ostream* out = owner_->options_.out;
            if (out == nullptr || text.empty())
                return;
            *out << text;
            out->flush();
        }

        SequenceIterator* owner_;
        std::unique_ptr<ProgressIndicator> progress_;
        std::vector<std::size_t> order_{};
        std::size_t position_{0};
        bool started_{false};
        bool finished_{false};
    };

    NamedTensors data_;
    DataLayout layout_;
    OnlineOptions options_;
    RandomState rnd_;
    std::size_t chunk_size_;
    std::size_t nr_sequences_{0};
};

/** Online (one sequence at a time) iterator. */
class Online : public SequenceIterator {
  public:
    explicit Online(NamedTensors named_data, const OnlineOptions& options = {})
        : SequenceIterator{std::move(named_data), options, 1} {}

    /// Scalars yielded per batch.
    std::size_t sample_size() const { return sequence_size(); }
};

/**
 * @brief Minibatch iterator.
 *
 * Only randomises the order of the minibatches; sequences are never moved
 * between minibatches.
 */
class Minibatches : public SequenceIterator {
  public:
    explicit Minibatches(NamedTensors named_data, const MinibatchOptions& options = {})
        : SequenceIterator{std::move(named_data), options, options.batch_size} {}

    std::size_t batch_size() const { return chunk_size(); }

    /// Scalars yielded per full minibatch.
    std::size_t sample_size() const { return sequence_size() * chunk_size(); }
};

inline std::shared_ptr<DataIterator> make_undivided(NamedTensors named_data) {
    return std::make_shared<Undivided>(std::move(named_data));
}

inline std::shared_ptr<DataIterator> make_online(NamedTensors named_data,
                                                 const OnlineOptions& options = {}) {
    return std::make_shared<Online>(std::move(named_data), options);
}

inline std::shared_ptr<DataIterator> make_minibatches(NamedTensors named_data,
                                                      const MinibatchOptions& options = {}) {
    return std::make_shared<Minibatches>(std::move(named_data), options);
}

} // namespace batchflow
