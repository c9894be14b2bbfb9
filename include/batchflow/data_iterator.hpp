#pragma once

/**
 * @file data_iterator.hpp
 * @brief The contract shared by every iterator of a feeding pipeline.
 *
 * A DataIterator describes how to walk over a dataset. Calling it creates a
 * BatchStream, a pull based state machine that yields one named batch per
 * next() call and an empty optional once it is exhausted. Nothing is
 * computed before the first pull and dropping a stream early is always
 * safe.
 *
 * Iterators are restartable: every call creates a fresh stream. Randomised
 * iterators keep advancing their own RandomState across calls, so two
 * epochs differ unless the caller resets the seed in between.
 *
 * A stream keeps a non-owning pointer to the iterator that created it, so
 * the iterator has to outlive its streams. None of these types are thread
 * safe.
 */

#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "batchflow/core.hpp"

namespace batchflow {

/** Lazily produced sequence of named batches. */
class BatchStream {
  public:
    virtual ~BatchStream() = default;

    /// Produce the next batch or an empty optional at the end of the epoch.
    virtual std::optional<NamedTensors> next() = 0;

    /** Single pass input iterator so streams work with range-based for. */
    class iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = NamedTensors;
        using difference_type = std::ptrdiff_t;
        using pointer = NamedTensors*;
        using reference = NamedTensors&;

        iterator() = default;
        explicit iterator(BatchStream* stream) : stream_{stream} { fetch(); }

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }

        iterator& operator++() {
            fetch();
            return *this;
        }

        bool operator==(const iterator& other) const { return done() == other.done(); }
        bool operator!=(const iterator& other) const { return !(*this == other); }

      private:
        void fetch() {
            if (stream_)
                current_ = stream_->next();
        }
        bool done() const { return !current_.has_value(); }

        BatchStream* stream_{nullptr};
        std::optional<NamedTensors> current_{};
    };

    iterator begin() { return iterator{this}; }
    iterator end() { return iterator{}; }
};

/**
 * @brief Polymorphic batch source.
 *
 * layout() declares the names, element types and shapes of the data the
 * iterator yields. Decorators validate their configuration against the
 * layout of the iterator they wrap.
 */
class DataIterator {
  public:
    virtual ~DataIterator() = default;

    /**
     * @brief Start a new pass over the data.
     *
     * @param handler Backend the batches are meant for. Passed through, never used.
     * @param verbose Request a progress bar. Iterators with their own
     *                verbosity setting ignore this flag.
     */
    std::unique_ptr<BatchStream> operator()(const Handler& handler, bool verbose = false) {
        return iterate(handler, verbose);
    }

    /// Names, types and shapes of the data this iterator yields.
    virtual const DataLayout& layout() const = 0;

    std::vector<std::string> data_names() const {
        std::vector<std::string> names;
        names.reserve(layout().size());
        for (const auto& entry : layout())
            names.push_back(entry.first);
        return names;
    }

  protected:
    virtual std::unique_ptr<BatchStream> iterate(const Handler& handler, bool verbose) = 0;
};

} // namespace batchflow
