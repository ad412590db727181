#pragma once

#include "links.hpp"

#include <string>
#include <vector>

struct CrawlConfig {
    std::string root_url;
    std::string extension;
    std::vector<std::string> ignore_patterns;

    std::string output_dir = ".";
    std::string manifest_path; // empty: no manifest

    int max_concurrency = 0; // 0: one task per directory, unbounded
    int delay_ms = 100;
    int timeout_ms = 30000;

    std::string site_origin = LinkRules::kDefaultOrigin;
    std::string marker_class = LinkRules::kDefaultMarkerClass;

    bool verbose = true;
    bool show_help = false;
};

// Throws InputValidationError on unknown flags, missing values or bad numbers.
CrawlConfig parse_args(int argc, const char* const* argv);

// Checks the URL and extension formats and compiles the ignore patterns.
void validate(const CrawlConfig& config);

LinkRules make_link_rules(const CrawlConfig& config);

// Space-delimited list; empty tokens are dropped.
std::vector<std::string> split_ignore_list(const std::string& list);

std::string usage(const std::string& program);
