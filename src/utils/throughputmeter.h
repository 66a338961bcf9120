/**
 * @file throughputmeter.h
 * @brief Rolling-window throughput smoothing for a single transfer attempt.
 */

#ifndef THROUGHPUTMETER_H
#define THROUGHPUTMETER_H

#include <cstddef>
#include <vector>

/**
 * @brief Smooths throughput samples (bytes/second) over a fixed window.
 *
 * Transfer clients report an instantaneous estimate with every progress
 * event, and those estimates jitter heavily on mobile links. The meter keeps
 * the last @c windowSize samples in a circular buffer and exposes their mean.
 * Negative samples are ignored.
 *
 * @par Example usage:
 * @code
 * ThroughputMeter meter(8);
 * meter.addSample(120000.0);
 * meter.addSample(80000.0);
 * double bps = meter.mean();  // 100000.0
 * @endcode
 */
class ThroughputMeter
{
public:
    static constexpr size_t DefaultWindowSize = 8;

    explicit ThroughputMeter(size_t windowSize = DefaultWindowSize)
        : windowSize_(windowSize > 0 ? windowSize : 1)
    {
        samples_.reserve(windowSize_);
    }

    /**
     * @brief Adds a sample, evicting the oldest one once the window is full.
     * @param bytesPerSecond Instantaneous throughput estimate.
     */
    void addSample(double bytesPerSecond)
    {
        if (bytesPerSecond < 0.0) {
            return;
        }

        if (samples_.size() < windowSize_) {
            samples_.push_back(bytesPerSecond);
            sum_ += bytesPerSecond;
        } else {
            sum_ -= samples_[writeIndex_];
            samples_[writeIndex_] = bytesPerSecond;
            sum_ += bytesPerSecond;
        }
        writeIndex_ = (writeIndex_ + 1) % windowSize_;
    }

    /// @return Mean of the samples in the window, or 0.0 if empty.
    [[nodiscard]] double mean() const
    {
        if (samples_.empty()) {
            return 0.0;
        }
        double value = sum_ / static_cast<double>(samples_.size());
        // Running sum can drift slightly below zero after many evictions
        return value > 0.0 ? value : 0.0;
    }

    [[nodiscard]] size_t count() const { return samples_.size(); }
    [[nodiscard]] size_t windowSize() const { return windowSize_; }
    [[nodiscard]] bool isEmpty() const { return samples_.empty(); }

    void clear()
    {
        samples_.clear();
        writeIndex_ = 0;
        sum_ = 0.0;
    }

private:
    size_t windowSize_;
    std::vector<double> samples_;
    size_t writeIndex_ = 0;
    double sum_ = 0.0;
};

#endif // THROUGHPUTMETER_H
