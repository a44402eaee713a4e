#include "LedgerApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    // stdout занят JSON-ответом, журнал компонентов уходит в stderr
    std::ostream out(std::cout.rdbuf());
    auto* stdoutBuf = std::cout.rdbuf(std::clog.rdbuf());

    int code = 1;
    try {
        ledger::LedgerApp app(out);

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        code = app.run(argc, argv);

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        code = 1;
    }

    std::cout.rdbuf(stdoutBuf);
    return code;
}
