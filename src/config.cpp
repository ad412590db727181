#include "config.hpp"

#include "errors.hpp"

#include <regex>
#include <sstream>

namespace {

std::string regex_escape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

int parse_non_negative(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw InputValidationError(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size() || v < 0) {
        throw InputValidationError(flag + " expects a non-negative number, got '" + value + "'");
    }
    return v;
}

} // namespace

std::vector<std::string> split_ignore_list(const std::string& list) {
    std::vector<std::string> out;
    std::istringstream iss(list);
    std::string token;
    while (std::getline(iss, token, ' ')) {
        if (!token.empty()) out.push_back(token);
    }
    return out;
}

CrawlConfig parse_args(int argc, const char* const* argv) {
    CrawlConfig c;
    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--help" || flag == "-h") {
            c.show_help = true;
            continue;
        }
        if (flag == "--quiet" || flag == "-q") {
            c.verbose = false;
            continue;
        }
        if (i + 1 >= argc) throw InputValidationError("missing value for " + flag);
        std::string value = argv[++i];

        if (flag == "--url") c.root_url = value;
        else if (flag == "--ext") c.extension = value;
        else if (flag == "--ignore") c.ignore_patterns = split_ignore_list(value);
        else if (flag == "--output-dir") c.output_dir = value;
        else if (flag == "--manifest") c.manifest_path = value;
        else if (flag == "--concurrency") c.max_concurrency = parse_non_negative(flag, value);
        else if (flag == "--delay-ms") c.delay_ms = parse_non_negative(flag, value);
        else if (flag == "--timeout-ms") c.timeout_ms = parse_non_negative(flag, value);
        else if (flag == "--origin") c.site_origin = value;
        else if (flag == "--marker-class") c.marker_class = value;
        else throw InputValidationError("unknown option " + flag);
    }
    return c;
}

void validate(const CrawlConfig& config) {
    static const std::regex origin_re(R"(^https:\/\/[^\/\s]+\/?$)");
    if (!std::regex_match(config.site_origin, origin_re)) {
        throw InputValidationError("origin must look like https://<host>, got '" + config.site_origin + "'");
    }
    std::string origin = config.site_origin;
    if (origin.back() == '/') origin.pop_back();

    const std::regex url_re("^" + regex_escape(origin) + "/.*$");
    if (!std::regex_match(config.root_url, url_re)) {
        throw InputValidationError("--url must match ^" + origin + "/.*$, got '" + config.root_url + "'");
    }

    static const std::regex ext_re(R"(^\.\S*$)");
    if (!std::regex_match(config.extension, ext_re)) {
        throw InputValidationError("--ext must be a dot-prefixed suffix like .md, got '" + config.extension + "'");
    }

    if (config.marker_class.empty()) throw InputValidationError("--marker-class must not be empty");

    make_link_rules(config);
}

LinkRules make_link_rules(const CrawlConfig& config) {
    return LinkRules(config.extension, config.ignore_patterns, config.site_origin, config.marker_class);
}

std::string usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options] --url \"<repository_url>\" --ext \"<files_extension>\"\n"
       << "Example: " << program << " --ignore \"Platform.Setters.Tests\" --url https://github.com/linksplatform/Setters/ --ext \".cs\"\n"
       << "Options:\n"
       << "  --ignore \"<dir> ...\"     space-separated patterns; matching directories are skipped\n"
       << "  --output-dir <dir>       where <repository>.md is written (default .)\n"
       << "  --manifest <file>        also write the found files as JSON\n"
       << "  --concurrency <n>        max fetches in flight, 0 = unbounded (default 0)\n"
       << "  --delay-ms <ms>          pause before each fetch (default 100)\n"
       << "  --timeout-ms <ms>        per request timeout (default 30000)\n"
       << "  --origin <url>           site origin (default " << LinkRules::kDefaultOrigin << ")\n"
       << "  --marker-class <class>   class attribute of listing rows (default \""
       << LinkRules::kDefaultMarkerClass << "\")\n"
       << "  --quiet                  no progress output\n";
    return os.str();
}
