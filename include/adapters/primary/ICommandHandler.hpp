#pragma once

#include "domain/errors/LedgerError.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Разобранная команда CLI
 *
 * args - позиционные аргументы после "<группа> <команда>",
 * options - именованные опции без "--".
 */
struct CommandRequest {
    std::vector<std::string> args;
    std::map<std::string, std::string> options;

    /**
     * @throws ValidationError если аргумента нет
     */
    const std::string& arg(size_t index, const std::string& name) const {
        if (index >= args.size()) {
            throw domain::ValidationError(name, "Missing argument: " + name);
        }
        return args[index];
    }

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @brief Ответ команды: код статуса в терминах HTTP и JSON-тело
 */
struct CommandResponse {
    int status = 200;
    nlohmann::json body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Обработчик одной команды CLI
 *
 * Доменные ошибки не перехватывает: их переводит в ответ CommandRouter.
 */
class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    virtual CommandResponse handle(const CommandRequest& req) = 0;
};

} // namespace ledger::adapters::primary
