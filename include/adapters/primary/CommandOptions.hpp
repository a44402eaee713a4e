#pragma once

#include "ICommandHandler.hpp"
#include "ports/input/ILedgerService.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief "true" / "false" -> флаг активности
 * @throws ValidationError для другого значения
 */
inline std::optional<bool> parseActiveFlag(const CommandRequest& req) {
    auto raw = req.option("active");
    if (!raw) return std::nullopt;
    if (*raw == "true" || *raw == "1") return true;
    if (*raw == "false" || *raw == "0") return false;
    throw domain::ValidationError("active", "Expected true or false, got: " + *raw);
}

/**
 * @brief Список UUID через запятую
 * @throws ValidationError если хотя бы один id некорректен
 */
inline std::vector<domain::WalletId> parseWalletIds(const std::optional<std::string>& raw) {
    std::vector<domain::WalletId> ids;
    if (!raw) return ids;

    std::istringstream ss(*raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            ids.push_back(domain::WalletId::parse(item));
        }
    }
    return ids;
}

inline int parseIntOption(const std::string& name, const std::string& raw) {
    try {
        size_t pos = 0;
        int value = std::stoi(raw, &pos);
        if (pos != raw.size()) {
            throw std::invalid_argument(raw);
        }
        return value;
    } catch (const std::logic_error&) {
        throw domain::ValidationError(name, "Invalid integer for " + name + ": " + raw);
    }
}

inline ports::input::PageQuery parsePageQuery(const CommandRequest& req) {
    ports::input::PageQuery query;
    if (auto page = req.option("page")) {
        query.page = parseIntOption("page", *page);
    }
    if (auto pageSize = req.option("page-size")) {
        query.pageSize = parseIntOption("page_size", *pageSize);
    }
    query.sort = req.option("sort");
    return query;
}

} // namespace ledger::adapters::primary
