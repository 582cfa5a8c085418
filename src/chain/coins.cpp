// STRATA - Coins Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/chain/coins.h"

namespace strata {

std::optional<Coin> CoinsViewOverlay::GetCoin(const OutPoint& outpoint) const {
    StorageError error;
    return FetchCoin(outpoint, error);
}

std::optional<Coin> CoinsViewOverlay::FetchCoin(const OutPoint& outpoint,
                                                StorageError& error) const {
    error = StorageError::NONE;
    if (spent_.Contains(outpoint)) {
        return std::nullopt;
    }
    auto it = added_.find(outpoint);
    if (it != added_.end()) {
        return it->second;
    }
    return base_.FetchCoin(outpoint, error);
}

void CoinsViewOverlay::ApplyTransaction(const Transaction& tx, int32_t height) {
    if (!tx.IsCoinBase()) {
        for (const auto& input : tx.vin) {
            added_.erase(input.prevout);
            spent_.Insert(input.prevout);
        }
    }
    const bool coinbase = tx.IsCoinBase();
    for (uint32_t i = 0; i < tx.vout.size(); ++i) {
        OutPoint outpoint(tx.GetHash(), i);
        spent_.Erase(outpoint);
        added_[outpoint] = Coin(tx.vout[i], height, coinbase);
    }
}

} // namespace strata
