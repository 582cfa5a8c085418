// STRATA - Difficulty Adjustment Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/consensus/difficulty.h"
#include "strata/core/arith.h"
#include "strata/util/logging.h"
#include <algorithm>

namespace strata {
namespace consensus {

namespace {

constexpr size_t MEDIAN_SPAN = 3;
constexpr size_t MEDIAN_TIME_PAST_SPAN = 11;

int64_t MedianOf(std::vector<int64_t> values) {
    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
}

unsigned int BitLength(uint64_t v) {
    unsigned int n = 0;
    while (v) {
        ++n;
        v >>= 1;
    }
    return n;
}

} // namespace

DifficultyParams DifficultyParams::FromConsensus(const Params& params) {
    DifficultyParams dp;
    dp.powLimitBits = params.nPowLimitBits;
    dp.targetSpacing = params.nPowTargetSpacing;
    dp.interval = params.nDifficultyInterval;
    dp.movingAverageWindow = params.nMovingAverageWindow;
    dp.maxAdjustmentFactor = params.nMaxAdjustmentFactor;
    dp.windowSize = static_cast<size_t>(std::max(params.nDifficultyInterval,
                                                 params.nMovingAverageWindow));
    return dp;
}

DifficultyAdjuster::DifficultyAdjuster(const DifficultyParams& params) : params_(params) {
    params_.interval = std::max(params_.interval, 1);
    params_.movingAverageWindow = std::max(params_.movingAverageWindow, 2);
    params_.maxAdjustmentFactor = std::max<int64_t>(params_.maxAdjustmentFactor, 1);
    params_.targetSpacing = std::max<int64_t>(params_.targetSpacing, 1);
    params_.windowSize = std::max<size_t>(params_.windowSize, 2);
}

void DifficultyAdjuster::AddBlock(int64_t timestamp) {
    window_.push_back(timestamp);
    while (window_.size() > params_.windowSize) {
        window_.pop_front();
    }
}

int64_t DifficultyAdjuster::GetMedianTimePast(const std::vector<int64_t>& timestamps) {
    if (timestamps.empty()) {
        return 0;
    }
    const size_t n = std::min(timestamps.size(), MEDIAN_TIME_PAST_SPAN);
    return MedianOf(std::vector<int64_t>(timestamps.end() - n, timestamps.end()));
}

int64_t DifficultyAdjuster::ClampedTimespan(const std::vector<int64_t>& timestamps,
                                            int64_t& expected) const {
    const size_t n = timestamps.size();
    if (n <= MEDIAN_SPAN) {
        expected = 0;
        return 0;
    }

    // Medians sit one position in from each end
    const int64_t start = MedianOf(std::vector<int64_t>(timestamps.begin(),
                                                        timestamps.begin() + MEDIAN_SPAN));
    const int64_t end = MedianOf(std::vector<int64_t>(timestamps.end() - MEDIAN_SPAN, timestamps.end()));
    const size_t intervals = n - MEDIAN_SPAN;

    expected = params_.targetSpacing * static_cast<int64_t>(intervals);
    const int64_t factor = params_.maxAdjustmentFactor;
    const int64_t minTimespan = (expected + factor - 1) / factor;
    const int64_t maxTimespan = expected * factor;

    int64_t actual = end - start;
    if (actual < minTimespan) {
        LOG_DEBUG(util::LogCategory::VALIDATION) << "Timespan " << actual
                                                 << " clamped up to " << minTimespan;
        actual = minTimespan;
    } else if (actual > maxTimespan) {
        LOG_DEBUG(util::LogCategory::VALIDATION) << "Timespan " << actual
                                                 << " clamped down to " << maxTimespan;
        actual = maxTimespan;
    }
    return actual;
}

uint32_t DifficultyAdjuster::NextTarget(const std::vector<int64_t>& history, int height,
                                        uint32_t currentBits) const {
    const uint32_t bits = currentBits == 0 ? params_.powLimitBits : currentBits;
    if (height <= 0 || history.size() < 2) {
        return bits;
    }

    const size_t span = (height % params_.interval == 0)
                            ? static_cast<size_t>(params_.interval)
                            : static_cast<size_t>(params_.movingAverageWindow);
    const size_t n = std::min(span, history.size());
    std::vector<int64_t> recent(history.end() - n, history.end());
    // Both medians need their own timestamps
    if (recent.size() <= MEDIAN_SPAN) {
        return bits;
    }

    int64_t expected = 0;
    const int64_t actual = ClampedTimespan(recent, expected);
    return Retarget(bits, actual, expected);
}

uint32_t DifficultyAdjuster::NextTargetFromWindow(int height, uint32_t currentBits) const {
    return NextTarget(std::vector<int64_t>(window_.begin(), window_.end()), height, currentBits);
}

uint32_t DifficultyAdjuster::Retarget(uint32_t currentBits, int64_t actual,
                                      int64_t expected) const {
    ArithUint256 limit;
    limit.SetCompact(params_.powLimitBits);

    bool negative = false;
    bool overflow = false;
    ArithUint256 old;
    old.SetCompact(currentBits, &negative, &overflow);
    if (negative || overflow || old.IsZero() || old > limit) {
        old = limit;
    }
    if (actual == expected) {
        return old.GetCompact();
    }

    const uint64_t factor = static_cast<uint64_t>(params_.maxAdjustmentFactor);
    const unsigned int actualBits = BitLength(static_cast<uint64_t>(actual));

    // Keep old * actual inside 256 bits; the dropped low bits are zero for
    // any target that came from a compact encoding
    ArithUint256 target = old;
    unsigned int shift = 0;
    while (target.bits() + actualBits >= 256) {
        target >>= 1;
        ++shift;
    }
    target *= static_cast<uint64_t>(actual);
    target /= ArithUint256(static_cast<uint64_t>(expected));
    if (shift > 0 && target.bits() + shift > 255) {
        target = limit;
    } else {
        target <<= shift;
    }

    const ArithUint256 lower = old / ArithUint256(factor);
    if (target < lower) {
        target = lower;
    }
    if (old.bits() + BitLength(factor) < 256) {
        const ArithUint256 upper = old * factor;
        if (target > upper) {
            target = upper;
        }
    }
    if (target > limit) {
        target = limit;
    }
    return target.GetCompact();
}

} // namespace consensus
} // namespace strata
