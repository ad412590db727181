#include "report.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using nlohmann::json;
namespace fs = std::filesystem;

namespace {

void ensure_parent_dir(const std::string& filepath) {
    fs::path parent = fs::path(filepath).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
}

std::ofstream open_output(const std::string& filepath) {
    ensure_parent_dir(filepath);
    std::ofstream ofs(filepath);
    if (!ofs) throw std::runtime_error("cannot open " + filepath + " for writing");
    return ofs;
}

} // namespace

// -------------------- grouping --------------------
GroupedFiles group_by_directory(const std::vector<FileLink>& files) {
    GroupedFiles grouped;
    for (const auto& f : files) grouped[f.parent].push_back(f);
    return grouped;
}

// -------------------- markdown --------------------
std::string render_markdown(const GroupedFiles& groups) {
    std::ostringstream os;
    for (const auto& [dir, files] : groups) {
        os << "* ###[" << (dir.name.empty() ? "/" : dir.name) << "](" << dir.href << ")\n";
        for (const auto& f : files) os << "- [ ] [" << f.name << "](" << f.href << ")\n";
        os << "\n";
    }
    return os.str();
}

std::string result_file_name(const std::string& rootUrl) {
    std::string path = rootUrl;
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) path.resize(cut);
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        // drop the host, only the path names the result
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }

    auto segs = split_path(path);
    if (segs.empty()) return "result.md";
    return segs.back() + ".md";
}

void write_markdown(const std::string& filepath, const GroupedFiles& groups) {
    std::ofstream ofs = open_output(filepath);
    ofs << render_markdown(groups);
    if (!ofs) throw std::runtime_error("failed writing " + filepath);
}

// -------------------- manifest --------------------
void write_manifest(const std::string& filepath, const std::vector<FileLink>& files) {
    json j = json::array();
    for (const auto& f : files) {
        j.push_back({
            {"name", f.name},
            {"href", f.href},
            {"directory", f.parent.name},
            {"directory_href", f.parent.href}
        });
    }
    std::ofstream ofs = open_output(filepath);
    ofs << j.dump(2);
    if (!ofs) throw std::runtime_error("failed writing " + filepath);
}
