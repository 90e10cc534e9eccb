#include "TransactionHttpServer.hpp"
#include "TransactionStore.hpp"
#include "txnlens/Config.hpp"
#include "txnlens/CsvLoader.hpp"
#include <iostream>

int main(int argc, char** argv) {
    try {
        auto config = txnlens::Config::load(argc > 1 ? argv[1] : "");
        std::cout << "Configuration: " << config.toJson().dump() << "\n";

        txnlens::TransactionStore store;
        txnlens::CsvLoader loader(config.progressEvery, config.verbose);
        auto report = loader.load(config.csvPath, store);
        if (!report) {
            std::cerr << "Failed to load transaction data: " << report.error().message << "\n";
            return 1;
        }
        std::cout << "Loaded " << report.value().loaded << " transactions ("
                  << report.value().errors << " rejected rows)\n";

        TransactionHttpServer app(config, store);
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
