// STRATA - Difficulty Adjustment
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Computes the proof-of-work target for the next block from the timestamps
// of the blocks before it.

#ifndef STRATA_CONSENSUS_DIFFICULTY_H
#define STRATA_CONSENSUS_DIFFICULTY_H

#include "strata/consensus/params.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace strata {
namespace consensus {

/// Inputs of the adjustment policies
struct DifficultyParams {
    uint32_t powLimitBits{0x1e0fffff};
    int64_t targetSpacing{150};

    /// Heights divisible by this get a full-interval recalculation
    int interval{2016};

    /// Timestamps used by the moving average between intervals
    int movingAverageWindow{17};

    /// Target moves by at most this factor per adjustment
    int64_t maxAdjustmentFactor{4};

    /// Capacity of the sliding timestamp window
    size_t windowSize{2016};

    static DifficultyParams FromConsensus(const Params& params);
};

/**
 * Difficulty adjuster with two policies.
 *
 * At heights that are a multiple of the interval the target is recomputed
 * over the whole interval; at every other height over a short moving
 * average. Elapsed time is always measured between the median of the
 * first three and the median of the last three timestamps, never from a
 * single block, and is clamped so the target moves by at most
 * maxAdjustmentFactor in either direction.
 *
 * Not thread-safe; the chain state manager serializes access.
 */
class DifficultyAdjuster {
public:
    explicit DifficultyAdjuster(const DifficultyParams& params);

    /// Append a timestamp, dropping the oldest once the window is full
    void AddBlock(int64_t timestamp);

    /// Forget the sliding window
    void Reset() { window_.clear(); }

    size_t WindowSize() const { return window_.size(); }
    const std::deque<int64_t>& Window() const { return window_; }

    /**
     * Compact target for the block at height.
     *
     * @param history Timestamps of the preceding blocks, oldest first
     * @param height Height of the block being built or checked
     * @param currentBits Target of the parent block
     */
    uint32_t NextTarget(const std::vector<int64_t>& history, int height,
                        uint32_t currentBits) const;

    /// NextTarget over the internal sliding window
    uint32_t NextTargetFromWindow(int height, uint32_t currentBits) const;

    /// Median of the last (up to) 11 timestamps; 0 for an empty list
    static int64_t GetMedianTimePast(const std::vector<int64_t>& timestamps);

    /**
     * Median-to-median elapsed time over timestamps, clamped to
     * [expected / factor, expected * factor]. Sets expected to the ideal
     * duration of the same span. Four timestamps at least; fewer give 0
     * for both.
     */
    int64_t ClampedTimespan(const std::vector<int64_t>& timestamps, int64_t& expected) const;

    const DifficultyParams& GetParams() const { return params_; }

private:
    /// old * actual / expected, capped at the pow limit
    uint32_t Retarget(uint32_t currentBits, int64_t actual, int64_t expected) const;

    DifficultyParams params_;
    std::deque<int64_t> window_;
};

} // namespace consensus
} // namespace strata

#endif // STRATA_CONSENSUS_DIFFICULTY_H
