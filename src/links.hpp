#pragma once

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

// A directory listing page. Identity is the path below the ref ("a/b"),
// the root of the tree has an empty name.
struct DirectoryLink {
    std::string name;
    std::string href;
};

inline bool operator==(const DirectoryLink& a, const DirectoryLink& b) { return a.name == b.name; }
inline bool operator!=(const DirectoryLink& a, const DirectoryLink& b) { return !(a == b); }
inline bool operator<(const DirectoryLink& a, const DirectoryLink& b) { return a.name < b.name; }

// A tracked file; name has the extension stripped.
struct FileLink {
    std::string name;
    std::string href;
    DirectoryLink parent;
};

using TypedLink = std::variant<DirectoryLink, FileLink>;

// What the classifier needs from one <a> element.
struct Anchor {
    std::map<std::string, std::string> attributes;
    std::optional<std::string> label; // text of the first child, if any
};

class LinkRules {
public:
    static constexpr const char* kDefaultOrigin = "https://github.com";
    static constexpr const char* kDefaultMarkerClass = "js-navigation-open link-gray-dark";

    // Throws InputValidationError if an ignore pattern is not a valid regex.
    LinkRules(std::string extension,
              const std::vector<std::string>& ignorePatterns,
              std::string origin = kDefaultOrigin,
              std::string markerClass = kDefaultMarkerClass);

    const std::string& extension() const { return extension_; }
    const std::string& origin() const { return origin_; }
    const std::string& marker_class() const { return markerClass_; }

    bool is_ignored(const std::string& dirName) const;

private:
    std::string extension_;
    std::string origin_;
    std::string markerClass_;
    std::vector<std::regex> ignore_;
};

// Directory, tracked file, or nothing. Unrecognized anchors are the common
// case and are never an error.
std::optional<TypedLink> classify_link(const Anchor& anchor, const LinkRules& rules);

// Split on '/' dropping empty segments.
std::vector<std::string> split_path(const std::string& path);
