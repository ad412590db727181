#pragma once

#include "links.hpp"

#include <map>
#include <string>
#include <vector>

using GroupedFiles = std::map<DirectoryLink, std::vector<FileLink>>;

// Partition by parent directory name; files keep their input order.
GroupedFiles group_by_directory(const std::vector<FileLink>& files);

// "* ###[dir](href)" heading, "- [ ] [file](href)" per file, blank line.
std::string render_markdown(const GroupedFiles& groups);

// Last non-empty path segment of the root URL plus ".md".
std::string result_file_name(const std::string& rootUrl);

void write_markdown(const std::string& filepath, const GroupedFiles& groups);
void write_manifest(const std::string& filepath, const std::vector<FileLink>& files);
