#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>

namespace batchflow {

/**
 * @brief Incremental textual progress report.
 *
 * start() returns the text to print before the first item and
 * advance() the text to print once @p current items are done. Callers
 * print whatever is returned, so a silent implementation simply returns
 * empty strings.
 */
class ProgressIndicator {
  public:
    virtual ~ProgressIndicator() = default;
    virtual std::string start() = 0;
    virtual std::string advance(std::size_t current) = 0;
};

/** Progress indicator that never prints anything. */
class Silence : public ProgressIndicator {
  public:
    std::string start() override { return {}; }
    std::string advance(std::size_t) override { return {}; }
};

/**
 * @brief Fixed width ruler that is drawn piece by piece.
 *
 * Each advance() returns only the part of the ruler that became visible
 * since the previous call. Once the ruler is complete the closing
 * bracket and the elapsed time are appended and later calls return
 * nothing. Values above the maximum are tolerated and complete the bar.
 */
class ProgressBar : public ProgressIndicator {
  public:
    static constexpr const char* kRuler = "====1====2====3====4====5====6====7====8====9====0";

    explicit ProgressBar(std::size_t maximum, std::string prefix = "[",
                         std::string ruler = kRuler, std::string suffix = "] Took: ")
        : maximum_{maximum}, prefix_{std::move(prefix)}, ruler_{std::move(ruler)},
          suffix_{std::move(suffix)} {}

    std::string start() override {
        start_time_ = std::chrono::steady_clock::now();
        return prefix_;
    }

    std::string advance(std::size_t current) override {
        if (finished_)
            return {};
        std::size_t j = ruler_.size();
        if (maximum_ > 0) {
            double fraction = static_cast<double>(current) / static_cast<double>(maximum_);
            j = static_cast<std::size_t>(std::trunc(fraction * static_cast<double>(ruler_.size())));
        }
        std::string out;
        if (j > drawn_) {
            j = std::min(j, ruler_.size());
            out = ruler_.substr(drawn_, j - drawn_);
            drawn_ = j;
        }
        if (drawn_ >= ruler_.size()) {
            finished_ = true;
            out += suffix_ + format_elapsed(std::chrono::steady_clock::now() - start_time_) + "\n";
        }
        return out;
    }

    bool finished() const { return finished_; }

    /// Render a duration as H:MM:SS.d
    static std::string format_elapsed(std::chrono::steady_clock::duration elapsed) {
        using namespace std::chrono;
        auto tenths = duration_cast<milliseconds>(elapsed).count() / 100;
        long long hours = tenths / 36000;
        long long minutes = (tenths / 600) % 60;
        long long seconds = (tenths / 10) % 60;
        long long fraction = tenths % 10;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld.%lld", hours, minutes, seconds,
                      fraction);
        return buf;
    }

  private:
    std::size_t maximum_;
    std::string prefix_;
    std::string ruler_;
    std::string suffix_;
    std::size_t drawn_{0};
    bool finished_{false};
    std::chrono::steady_clock::time_point start_time_{std::chrono::steady_clock::now()};
};

/** Pick the active bar or the silent indicator. */
inline std::unique_ptr<ProgressIndicator> make_progress(bool verbose, std::size_t maximum) {
    if (verbose)
        return std::make_unique<ProgressBar>(maximum);
    return std::make_unique<Silence>();
}

} // namespace batchflow
