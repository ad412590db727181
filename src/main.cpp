#include "app.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "page_source.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "treemark";

    CrawlConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const InputValidationError& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << usage(program);
        return kExitBadInput;
    }
    if (config.show_help) {
        std::cout << usage(program);
        return kExitOk;
    }

    HttpPageSource source(config.timeout_ms, config.verbose ? &std::cout : nullptr);
    return run(config, source, std::cout, std::cerr);
}
