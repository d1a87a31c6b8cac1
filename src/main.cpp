#include "AutoConfig.h"
#include "AutomationPipeline.h"
#include "HackneyExceptions.h"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << AutoConfig::usage();
            return 0;
        }
    }

    AutoConfig config;
    try {
        config = AutoConfig::fromArgs(argc, argv);
    } catch (const Hackney::HackneyException& e) {
        std::cerr << "[Hackney][Error] " << e.what() << "\n";
        return 1;
    }

    if (config.verbose) std::cout << "Hackney: trip record cleaning and feature engineering\n";

    try {
        AutomationPipeline pipeline;
        return pipeline.run(config);
    } catch (const Hackney::HackneyException& e) {
        std::cerr << "[Hackney][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Hackney][Exception] " << e.what() << "\n";
        return 1;
    }
}
