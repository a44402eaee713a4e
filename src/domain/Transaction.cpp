#include "domain/Transaction.hpp"
#include "domain/errors/LedgerError.hpp"
#include <algorithm>

namespace ledger::domain {

Transaction::Transaction(
    const TransactionId& id,
    const WalletId& walletId,
    const TxId& txid,
    const Money& amount,
    bool isActive,
    std::optional<Timestamp> deactivatedAt,
    const Timestamp& createdAt,
    const Timestamp& updatedAt)
    : id_(id)
    , walletId_(walletId)
    , txid_(txid)
    , amount_(amount)
    , isActive_(isActive)
    , deactivatedAt_(std::move(deactivatedAt))
    , createdAt_(createdAt)
    , updatedAt_(updatedAt)
{
    if (amount_.isZero()) {
        throw ValidationError("amount", "Amount cannot be zero");
    }
    if (isActive_ == deactivatedAt_.has_value()) {
        throw ValidationError("deactivated_at",
            "Transaction " + id_.value() + ": deactivated_at must be set iff the transaction is inactive");
    }
    if (updatedAt_ < createdAt_) {
        throw ValidationError("updated_at",
            "Transaction " + id_.value() + ": updated_at precedes created_at");
    }
}

Transaction Transaction::create(
    const TransactionId& id,
    const WalletId& walletId,
    const TxId& txid,
    const Money& amount)
{
    auto now = Timestamp::now();
    return Transaction(id, walletId, txid, amount, true, std::nullopt, now, now);
}

Transaction Transaction::restore(
    const TransactionId& id,
    const WalletId& walletId,
    const TxId& txid,
    const Money& amount,
    bool isActive,
    std::optional<Timestamp> deactivatedAt,
    const Timestamp& createdAt,
    const Timestamp& updatedAt)
{
    return Transaction(id, walletId, txid, amount, isActive, std::move(deactivatedAt), createdAt, updatedAt);
}

void Transaction::deactivate() {
    if (!isActive_) {
        throw AlreadyDeactivatedError("Transaction", id_.value());
    }

    auto now = std::max(Timestamp::now(), updatedAt_);
    isActive_ = false;
    deactivatedAt_ = now;
    updatedAt_ = now;
}

std::ostream& operator<<(std::ostream& os, const Transaction& tx) {
    return os << "Transaction(id=" << tx.id()
              << ", wallet_id=" << tx.walletId()
              << ", txid='" << tx.txid() << "'"
              << ", amount=" << tx.amount()
              << ", active=" << (tx.isActive() ? "true" : "false") << ")";
}

} // namespace ledger::domain
