#include "links.hpp"

#include "errors.hpp"

#include <algorithm>

namespace {

struct UrlParts {
    std::string origin; // scheme://host
    std::string path;
};

bool starts_with(const std::string& s, const std::string& pre) {
    return s.rfind(pre, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return std::equal(s.end() - suf.size(), s.end(), suf.begin());
}

std::optional<UrlParts> parse_url(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*:\/\/[^\/?#]+)([^?#]*))");
    std::smatch m;
    if (!std::regex_search(url, m, re)) return std::nullopt;
    UrlParts p;
    p.origin = m[1].str();
    p.path = m[2].str();
    return p;
}

std::string absolute_url(const std::string& href, const std::string& origin) {
    if (starts_with(href, "http://") || starts_with(href, "https://")) return href;
    if (!starts_with(href, "/")) return origin + "/" + href;
    return origin + href;
}

std::string join_path(const std::vector<std::string>& segments, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to && i < segments.size(); ++i) {
        if (!out.empty()) out += '/';
        out += segments[i];
    }
    return out;
}

// owner/repo/<kind>/<ref>/...
constexpr size_t kKindIndex = 2;
constexpr size_t kRefIndex = 3;
constexpr size_t kRestIndex = 4;

} // namespace

// -------------------- path helpers --------------------
std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        if (slash > pos) out.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return out;
}

// -------------------- rules --------------------
LinkRules::LinkRules(std::string extension,
                     const std::vector<std::string>& ignorePatterns,
                     std::string origin,
                     std::string markerClass)
    : extension_(std::move(extension)),
      origin_(std::move(origin)),
      markerClass_(std::move(markerClass)) {
    while (ends_with(origin_, "/")) origin_.pop_back();
    for (const auto& p : ignorePatterns) {
        if (p.empty()) continue;
        try {
            ignore_.emplace_back(p);
        } catch (const std::regex_error& ex) {
            throw InputValidationError("invalid ignore pattern '" + p + "': " + ex.what());
        }
    }
}

bool LinkRules::is_ignored(const std::string& dirName) const {
    for (const auto& re : ignore_) {
        if (std::regex_search(dirName, re)) return true;
    }
    return false;
}

// -------------------- classification --------------------
std::optional<TypedLink> classify_link(const Anchor& anchor, const LinkRules& rules) {
    auto cls = anchor.attributes.find("class");
    if (cls == anchor.attributes.end() || cls->second != rules.marker_class()) return std::nullopt;

    auto href = anchor.attributes.find("href");
    if (href == anchor.attributes.end() || href->second.empty()) return std::nullopt;
    if (!anchor.label) return std::nullopt;

    const std::string url = absolute_url(href->second, rules.origin());
    auto parts = parse_url(url);
    if (!parts) return std::nullopt;

    auto segs = split_path(parts->path);
    if (segs.size() <= kRestIndex) return std::nullopt;

    const std::string& kind = segs[kKindIndex];
    bool isDir = kind == "tree";
    bool isFile = kind == "blob" && ends_with(parts->path, rules.extension());
    if (!isDir && !isFile) return std::nullopt;

    std::string dirName = isDir ? join_path(segs, kRestIndex, segs.size())
                                : join_path(segs, kRestIndex, segs.size() - 1);
    if (rules.is_ignored(dirName)) return std::nullopt;

    if (isDir) return TypedLink{DirectoryLink{dirName, url}};

    std::string parentHref = parts->origin + "/" + join_path(segs, 0, kKindIndex) +
                             "/tree/" + segs[kRefIndex];
    if (!dirName.empty()) parentHref += "/" + dirName;

    std::string name = *anchor.label;
    if (ends_with(name, rules.extension())) name.resize(name.size() - rules.extension().size());

    return TypedLink{FileLink{name, url, DirectoryLink{dirName, parentHref}}};
}
