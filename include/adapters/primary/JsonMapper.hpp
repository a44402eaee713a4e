#pragma once

#include "domain/Page.hpp"
#include "domain/Transaction.hpp"
#include "domain/TransactionResult.hpp"
#include "domain/Wallet.hpp"
#include <nlohmann/json.hpp>

namespace ledger::adapters::primary {

/**
 * @brief Сущности в JSON для вывода CLI
 *
 * Суммы выводятся строками: 18 разрядов не помещаются в double без потерь.
 */
inline nlohmann::json toJson(const domain::Transaction& tx) {
    nlohmann::json j;
    j["id"] = tx.id().value();
    j["wallet_id"] = tx.walletId().value();
    j["txid"] = tx.txid().value();
    j["amount"] = tx.amount().toString();
    j["is_active"] = tx.isActive();
    j["deactivated_at"] = tx.deactivatedAt() ? nlohmann::json(tx.deactivatedAt()->toString()) : nlohmann::json();
    j["created_at"] = tx.createdAt().toString();
    j["updated_at"] = tx.updatedAt().toString();
    return j;
}

inline nlohmann::json toJson(const domain::Wallet& wallet, bool withTransactions = false) {
    nlohmann::json j;
    j["id"] = wallet.id().value();
    j["label"] = wallet.label();
    j["balance"] = wallet.balance().toString();
    j["is_active"] = wallet.isActive();
    j["deactivated_at"] = wallet.deactivatedAt() ? nlohmann::json(wallet.deactivatedAt()->toString()) : nlohmann::json();
    j["created_at"] = wallet.createdAt().toString();
    j["updated_at"] = wallet.updatedAt().toString();

    if (withTransactions) {
        j["transactions"] = nlohmann::json::array();
        for (const auto& tx : wallet.transactions()) {
            j["transactions"].push_back(toJson(tx));
        }
    }
    return j;
}

inline nlohmann::json toJson(const domain::TransactionResult& result) {
    nlohmann::json j;
    j["transaction"] = toJson(result.transaction);
    j["wallet"] = toJson(result.wallet);
    return j;
}

template <typename T>
nlohmann::json toJson(const domain::Page<T>& page) {
    nlohmann::json j;
    j["count"] = page.count;
    j["page"] = page.page;
    j["pages"] = page.pages;
    j["page_size"] = page.pageSize;
    j["results"] = nlohmann::json::array();
    for (const auto& item : page.items) {
        j["results"].push_back(toJson(item));
    }
    return j;
}

} // namespace ledger::adapters::primary
