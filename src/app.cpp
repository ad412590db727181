#include "app.hpp"

#include "crawler.hpp"
#include "errors.hpp"
#include "report.hpp"

#include <filesystem>

namespace fs = std::filesystem;

int run(const CrawlConfig& config, PageSource& source, std::ostream& out, std::ostream& err) {
    try {
        validate(config);

        LinkRules rules = make_link_rules(config);
        Crawler crawler(source, rules, config.max_concurrency, config.delay_ms, config.verbose ? &out : nullptr);
        CrawlResult files = crawler.crawl(config.root_url);

        auto mdPath = (fs::path(config.output_dir) / result_file_name(config.root_url)).string();
        write_markdown(mdPath, group_by_directory(files));
        if (config.verbose) out << "Written: " << mdPath << ", files: " << files.size() << std::endl;

        if (!config.manifest_path.empty()) {
            write_manifest(config.manifest_path, files);
            if (config.verbose) out << "Manifest written: " << config.manifest_path << std::endl;
        }
    } catch (const InputValidationError& ex) {
        err << "Error: " << ex.what() << std::endl;
        return kExitBadInput;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << std::endl;
        return kExitFailure;
    }
    return kExitOk;
}
