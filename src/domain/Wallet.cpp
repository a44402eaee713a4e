#include "domain/Wallet.hpp"
#include "domain/errors/LedgerError.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace ledger::domain {

namespace {

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

Wallet::Wallet(
    const WalletId& id,
    const std::string& label,
    const Money& balance,
    bool isActive,
    std::optional<Timestamp> deactivatedAt,
    const Timestamp& createdAt,
    const Timestamp& updatedAt,
    std::vector<Transaction> transactions)
    : id_(id)
    , label_(label)
    , balance_(balance)
    , isActive_(isActive)
    , deactivatedAt_(std::move(deactivatedAt))
    , createdAt_(createdAt)
    , updatedAt_(updatedAt)
    , transactions_(std::move(transactions))
{
    if (balance_.isNegative()) {
        throw ValidationError("balance", "Wallet " + id_.value() + " has negative balance " + balance_.toString());
    }
    if (isActive_ == deactivatedAt_.has_value()) {
        throw ValidationError("deactivated_at",
            "Wallet " + id_.value() + ": deactivated_at must be set iff the wallet is inactive");
    }
    if (updatedAt_ < createdAt_) {
        throw ValidationError("updated_at", "Wallet " + id_.value() + ": updated_at precedes created_at");
    }
}

Wallet Wallet::create(const WalletId& id, const std::string& label) {
    auto now = Timestamp::now();
    return Wallet(id, normalizeLabel(label), Money::zero(), true, std::nullopt, now, now, {});
}

Wallet Wallet::restore(
    const WalletId& id,
    const std::string& label,
    const Money& balance,
    bool isActive,
    std::optional<Timestamp> deactivatedAt,
    const Timestamp& createdAt,
    const Timestamp& updatedAt,
    std::vector<Transaction> transactions)
{
    return Wallet(id, label, balance, isActive, std::move(deactivatedAt),
                  createdAt, updatedAt, std::move(transactions));
}

std::string Wallet::normalizeLabel(const std::string& label) {
    auto trimmed = trim(label);
    if (trimmed.empty()) {
        throw ValidationError("label", "Label cannot be empty");
    }
    if (trimmed.size() > kMaxLabelLength) {
        throw ValidationError("label", "Label cannot exceed 255 characters");
    }
    return trimmed;
}

void Wallet::updateLabel(const std::string& newLabel) {
    if (!isActive_) {
        throw AlreadyDeactivatedError("Wallet", id_.value());
    }
    label_ = normalizeLabel(newLabel);
    touch();
}

void Wallet::addTransaction(const Transaction& transaction) {
    if (!isActive_) {
        throw AlreadyDeactivatedError("Wallet", id_.value());
    }
    if (transaction.walletId() != id_) {
        throw ValidationError("wallet_id",
            "Transaction " + transaction.id().value() + " belongs to wallet " +
            transaction.walletId().value() + ", not " + id_.value());
    }

    // Только список; баланс считает хранилище под блокировкой
    transactions_.push_back(transaction);
    touch();
}

void Wallet::deactivate() {
    if (!isActive_) {
        throw AlreadyDeactivatedError("Wallet", id_.value());
    }

    touch();
    isActive_ = false;
    deactivatedAt_ = updatedAt_;

    for (auto& transaction : transactions_) {
        if (transaction.isActive()) {
            transaction.deactivate();
        }
    }
}

std::vector<Transaction> Wallet::getActiveTransactions() const {
    std::vector<Transaction> result;
    std::copy_if(transactions_.begin(), transactions_.end(), std::back_inserter(result),
        [](const Transaction& tx) { return tx.isActive(); });
    return result;
}

Money Wallet::calculateBalanceFromTransactions() const {
    Money total;
    for (const auto& tx : transactions_) {
        if (tx.isActive()) {
            total += tx.amount();
        }
    }
    return total;
}

void Wallet::touch() {
    updatedAt_ = std::max(Timestamp::now(), updatedAt_);
}

std::ostream& operator<<(std::ostream& os, const Wallet& wallet) {
    return os << "Wallet(id=" << wallet.id()
              << ", label='" << wallet.label() << "'"
              << ", balance=" << wallet.balance()
              << ", active=" << (wallet.isActive() ? "true" : "false") << ")";
}

} // namespace ledger::domain
