// STRATA - Block Undo Data
// Copyright (c) 2024 STRATA Developers
// MIT License

#ifndef STRATA_CHAIN_UNDO_H
#define STRATA_CHAIN_UNDO_H

#include "strata/chain/coins.h"
#include "strata/core/serialize.h"
#include "strata/core/types.h"
#include <vector>

namespace strata {

/// A coin consumed by a block, kept so the spend can be reversed
struct SpentCoin {
    OutPoint outpoint;
    Coin coin;

    SpentCoin() = default;
    SpentCoin(const OutPoint& o, const Coin& c) : outpoint(o), coin(c) {}

    bool operator==(const SpentCoin& other) const {
        return outpoint == other.outpoint && coin == other.coin;
    }
};

template<typename Stream>
void Serialize(Stream& s, const SpentCoin& sc) {
    Serialize(s, sc.outpoint);
    Serialize(s, sc.coin);
}

template<typename Stream>
void Unserialize(Stream& s, SpentCoin& sc) {
    Unserialize(s, sc.outpoint);
    Unserialize(s, sc.coin);
}

/**
 * Everything needed to reverse one connected block: the coins it spent, in
 * spend order, and the outpoints it created.
 */
struct UndoRecord {
    BlockHash block;
    /// Best block of the coin set before this block was applied
    BlockHash prev;
    int32_t height{0};
    std::vector<SpentCoin> spent;
    std::vector<OutPoint> created;

    void Clear() {
        block.SetNull();
        prev.SetNull();
        height = 0;
        spent.clear();
        created.clear();
    }

    bool operator==(const UndoRecord& other) const {
        return block == other.block && prev == other.prev && height == other.height &&
               spent == other.spent && created == other.created;
    }
};

template<typename Stream>
void Serialize(Stream& s, const UndoRecord& undo) {
    Serialize(s, undo.block);
    Serialize(s, undo.prev);
    Serialize(s, undo.height);
    Serialize(s, undo.spent);
    Serialize(s, undo.created);
}

template<typename Stream>
void Unserialize(Stream& s, UndoRecord& undo) {
    Unserialize(s, undo.block);
    Unserialize(s, undo.prev);
    Unserialize(s, undo.height);
    Unserialize(s, undo.spent);
    Unserialize(s, undo.created);
}

} // namespace strata

#endif // STRATA_CHAIN_UNDO_H
