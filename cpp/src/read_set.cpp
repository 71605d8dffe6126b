#include "../include/read_set.hpp"

namespace actionstream {
namespace core {

std::string normalize_path(std::string_view path, std::string_view workDir) {
    std::string_view p = path;

    if (!workDir.empty() && p.starts_with(workDir)) {
        std::string_view rest = p.substr(workDir.size());
        if (rest.empty() || rest.front() == '/') {
            p = rest;
            while (!p.empty() && p.front() == '/') p.remove_prefix(1);
        }
    }
    while (p.starts_with("./")) {
        p.remove_prefix(2);
        while (!p.empty() && p.front() == '/') p.remove_prefix(1);
    }

    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    return out;
}

bool default_read_exemption(const std::string& relPath) {
    if (relPath == "src/assets.json") return true;
    return relPath.starts_with("PROJECT/") && relPath.ends_with(".md");
}

bool PathSet::contains(std::string_view path) const {
    return paths_.count(normalize_path(path, workDir_)) != 0;
}

bool PathSet::insert_(std::string_view path) {
    return paths_.insert(normalize_path(path, workDir_)).second;
}

void InMemoryFileStore::put(std::string_view path, std::string content) {
    files_[normalize_path(path, workDir_)] = std::move(content);
}

bool InMemoryFileStore::erase(std::string_view path) {
    return files_.erase(normalize_path(path, workDir_)) != 0;
}

std::optional<std::string> InMemoryFileStore::getContents(const std::string& path) const {
    auto it = files_.find(normalize_path(path, workDir_));
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

} // namespace core
} // namespace actionstream
