#pragma once

#include "Transaction.hpp"
#include "Wallet.hpp"

namespace ledger::domain {

/**
 * @brief Результат протокола создания транзакции
 *
 * wallet содержит баланс, подтверждённый хранилищем, а не посчитанный в памяти.
 */
struct TransactionResult {
    Transaction transaction;
    Wallet wallet;
};

} // namespace ledger::domain
