// Grouping, markdown rendering, result file naming and the JSON manifest.

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "report.hpp"

namespace fs = std::filesystem;

static FileLink file(const std::string& dir, const std::string& name) {
    std::string dirHref = "https://github.com/o/r/tree/main" + (dir.empty() ? "" : "/" + dir);
    std::string path = dir.empty() ? name : dir + "/" + name;
    return FileLink{name, "https://github.com/o/r/blob/main/" + path + ".md", DirectoryLink{dir, dirHref}};
}

void test_group_preserves_insertion_order() {
    std::vector<FileLink> files = {file("a", "1"), file("b", "2"), file("a", "3"), file("", "4")};
    auto groups = group_by_directory(files);
    assert(groups.size() == 3);
    const auto& a = groups.at(DirectoryLink{"a", ""});
    assert(a.size() == 2);
    assert(a[0].name == "1" && a[1].name == "3");
    assert(groups.at(DirectoryLink{"", "ignored"}).front().name == "4");
    std::cout << "✓ test_group_preserves_insertion_order\n";
}

void test_group_keyed_by_name_only() {
    FileLink x = file("a", "x");
    FileLink y = file("a", "y");
    y.parent.href = "https://mirror.example/o/r/tree/main/a";
    auto groups = group_by_directory({x, y});
    assert(groups.size() == 1);
    assert(groups.begin()->second.size() == 2);
    std::cout << "✓ test_group_keyed_by_name_only\n";
}

void test_group_membership_independent_of_order() {
    std::vector<FileLink> files = {file("a", "1"), file("b", "2"), file("a", "3"), file("c", "4"), file("b", "5")};
    std::vector<FileLink> reversed(files.rbegin(), files.rend());

    auto g1 = group_by_directory(files);
    auto g2 = group_by_directory(reversed);
    assert(g1.size() == g2.size());
    for (const auto& [dir, members] : g1) {
        std::vector<std::string> m1, m2;
        for (const auto& f : members) m1.push_back(f.href);
        for (const auto& f : g2.at(dir)) m2.push_back(f.href);
        std::sort(m1.begin(), m1.end());
        std::sort(m2.begin(), m2.end());
        assert(m1 == m2);
    }
    std::cout << "✓ test_group_membership_independent_of_order\n";
}

void test_render_markdown() {
    auto groups = group_by_directory({file("docs", "guide"), file("", "readme")});
    std::string expected =
        "* ###[/](https://github.com/o/r/tree/main)\n"
        "- [ ] [readme](https://github.com/o/r/blob/main/readme.md)\n"
        "\n"
        "* ###[docs](https://github.com/o/r/tree/main/docs)\n"
        "- [ ] [guide](https://github.com/o/r/blob/main/docs/guide.md)\n"
        "\n";
    assert(render_markdown(groups) == expected);
    assert(render_markdown({}).empty());
    std::cout << "✓ test_render_markdown\n";
}

void test_result_file_name() {
    assert(result_file_name("https://github.com/linksplatform/Setters/") == "Setters.md");
    assert(result_file_name("https://github.com/linksplatform/Setters") == "Setters.md");
    assert(result_file_name("https://github.com/o/r/tree/main/src?x=1") == "src.md");
    // the host never names the file
    assert(result_file_name("https://github.com/") == "result.md");
    assert(result_file_name("https://github.com") == "result.md");
    assert(result_file_name("https://github.com?tab=repositories") == "result.md");
    std::cout << "✓ test_result_file_name\n";
}

void test_write_markdown_and_manifest() {
    fs::path dir = fs::temp_directory_path() / "treemark_report_test";
    fs::remove_all(dir);

    std::vector<FileLink> files = {file("docs", "guide"), file("", "readme")};
    std::string mdPath = (dir / "out" / "r.md").string();
    write_markdown(mdPath, group_by_directory(files));

    std::ifstream md(mdPath);
    std::stringstream body;
    body << md.rdbuf();
    assert(body.str() == render_markdown(group_by_directory(files)));

    std::string jsonPath = (dir / "manifest.json").string();
    write_manifest(jsonPath, files);
    std::ifstream js(jsonPath);
    nlohmann::json j = nlohmann::json::parse(js);
    assert(j.is_array() && j.size() == 2);
    assert(j[0]["name"] == "guide");
    assert(j[0]["directory"] == "docs");
    assert(j[0]["directory_href"] == "https://github.com/o/r/tree/main/docs");
    assert(j[1]["href"] == "https://github.com/o/r/blob/main/readme.md");

    fs::remove_all(dir);
    std::cout << "✓ test_write_markdown_and_manifest\n";
}

int main() {
    test_group_preserves_insertion_order();
    test_group_keyed_by_name_only();
    test_group_membership_independent_of_order();
    test_render_markdown();
    test_result_file_name();
    test_write_markdown_and_manifest();
    std::cout << "All report tests passed\n";
    return 0;
}
