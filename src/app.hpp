#pragma once

#include "config.hpp"

#include <ostream>

class PageSource;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitBadInput = 2;

// Validate, crawl, write <output_dir>/<name>.md and the optional manifest.
// Progress goes to out when config.verbose is set, diagnostics to err.
// Nothing is written unless the whole crawl succeeds.
int run(const CrawlConfig& config, PageSource& source, std::ostream& out, std::ostream& err);
