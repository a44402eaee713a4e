// include/domain/Page.hpp
#pragma once

#include "Identifiers.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Запрос страницы: номер (с 1), размер, необязательный ключ сортировки
 *
 * Ключ сортировки: имя поля, "-" в начале - по убыванию ("-balance").
 */
struct PageRequest {
    int page = 1;
    int pageSize = 20;
    std::optional<std::string> sort;
};

/**
 * @brief Страница результатов с метаданными
 */
template <typename T>
struct Page {
    std::vector<T> items;
    int64_t count = 0;   ///< Всего записей под фильтром
    int page = 1;        ///< Фактический номер страницы
    int pages = 1;       ///< Всего страниц (минимум 1)
    int pageSize = 20;
};

/**
 * @brief Разрешённая сортировка
 */
struct SortOrder {
    std::string field;
    bool descending = false;

    bool operator==(const SortOrder& other) const {
        return field == other.field && descending == other.descending;
    }
};

/**
 * @brief Выбрать сортировку из списка разрешённых полей
 *
 * Неизвестный ключ не ошибка: возвращается сортировка по умолчанию.
 */
inline SortOrder resolveSort(
    const std::optional<std::string>& requested,
    const std::set<std::string>& allowedFields,
    const SortOrder& fallback)
{
    if (!requested || requested->empty()) {
        return fallback;
    }

    SortOrder order;
    order.descending = requested->front() == '-';
    order.field = order.descending ? requested->substr(1) : *requested;

    if (allowedFields.count(order.field) == 0) {
        return fallback;
    }
    return order;
}

/**
 * @brief Окно страницы: фактический номер, число страниц, смещение
 *
 * Страница за пределами диапазона заменяется последней.
 */
struct PageWindow {
    int page = 1;
    int pages = 1;
    int64_t offset = 0;
};

inline PageWindow computePageWindow(int64_t count, int requestedPage, int pageSize) {
    PageWindow window;
    window.pages = count == 0 ? 1 : static_cast<int>((count + pageSize - 1) / pageSize);
    window.page = std::clamp(requestedPage, 1, window.pages);
    window.offset = static_cast<int64_t>(window.page - 1) * pageSize;
    return window;
}

/**
 * @brief Фильтр кошельков
 *
 * Пустой walletIds означает "без фильтра по id".
 */
struct WalletFilter {
    std::optional<bool> isActive;
    std::vector<WalletId> walletIds;
};

struct TransactionFilter {
    std::optional<bool> isActive;
    std::vector<WalletId> walletIds;
};

namespace sorting {

inline const std::set<std::string>& walletFields() {
    static const std::set<std::string> fields{"balance", "created_at", "updated_at", "label"};
    return fields;
}

inline const std::set<std::string>& transactionFields() {
    static const std::set<std::string> fields{"created_at", "updated_at", "amount", "txid"};
    return fields;
}

/// По умолчанию: самые большие балансы первыми
inline SortOrder defaultWalletSort() { return {"balance", true}; }

/// По умолчанию: новые транзакции первыми
inline SortOrder defaultTransactionSort() { return {"created_at", true}; }

} // namespace sorting

} // namespace ledger::domain
