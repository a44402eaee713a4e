#pragma once

#include "ICommandHandler.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief Таблица команд "<группа> <команда>" -> обработчик
 *
 * Единственное место, где доменные ошибки превращаются в ответ:
 * - ValidationError 400, NotFoundError 404
 * - AlreadyDeactivatedError 409, ConflictError 409
 * - InsufficientBalanceError 422 (с current / transaction / new_balance)
 * - LockTimeoutError 503 (retryable)
 * - остальное 500 "Internal error" без подробностей
 */
class CommandRouter {
public:
    void registerCommand(const std::string& group, const std::string& command,
                         std::shared_ptr<ICommandHandler> handler) {
        handlers_[key(group, command)] = std::move(handler);
    }

    bool hasCommand(const std::string& group, const std::string& command) const {
        return handlers_.count(key(group, command)) > 0;
    }

    CommandResponse dispatch(const std::string& group, const std::string& command, const CommandRequest& req) {
        auto it = handlers_.find(key(group, command));
        if (it == handlers_.end()) {
            return errorResponse(400, "UNKNOWN_COMMAND", "Unknown command: " + key(group, command));
        }

        try {
            return it->second->handle(req);
        } catch (const domain::InsufficientBalanceError& e) {
            auto res = errorResponse(422, toString(e.kind()), e.what());
            res.body["current_balance"] = e.current().toString();
            res.body["transaction_amount"] = e.delta().toString();
            res.body["new_balance"] = e.resulting().toString();
            return res;
        } catch (const domain::ValidationError& e) {
            auto res = errorResponse(400, toString(e.kind()), e.what());
            res.body["field"] = e.field();
            return res;
        } catch (const domain::LedgerError& e) {
            auto res = errorResponse(statusFor(e.kind()), toString(e.kind()), e.what());
            res.body["retryable"] = e.retryable();
            return res;
        } catch (const std::exception& e) {
            std::cerr << "[CommandRouter] " << key(group, command) << " failed: " << e.what() << std::endl;
            return errorResponse(500, "INTERNAL", "Internal error");
        }
    }

    static int statusFor(domain::ErrorKind kind) {
        switch (kind) {
            case domain::ErrorKind::VALIDATION:           return 400;
            case domain::ErrorKind::NOT_FOUND:            return 404;
            case domain::ErrorKind::ALREADY_DEACTIVATED:  return 409;
            case domain::ErrorKind::CONFLICT:             return 409;
            case domain::ErrorKind::INSUFFICIENT_BALANCE: return 422;
            case domain::ErrorKind::LOCK_TIMEOUT:         return 503;
            default: return 500;
        }
    }

private:
    std::map<std::string, std::shared_ptr<ICommandHandler>> handlers_;

    static std::string key(const std::string& group, const std::string& command) {
        return group + " " + command;
    }

    static CommandResponse errorResponse(int status, const std::string& code, const std::string& message) {
        CommandResponse res;
        res.status = status;
        res.body["error"] = code;
        res.body["message"] = message;
        return res;
    }
};

} // namespace ledger::adapters::primary
