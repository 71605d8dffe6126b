#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace actionstream {
namespace core {

inline constexpr std::string_view kDefaultWorkDir = "/home/project";

/// Strips "./" and the work-directory prefix and collapses duplicate slashes.
std::string normalize_path(std::string_view path, std::string_view workDir = kDefaultWorkDir);

/// PROJECT/**.md and src/assets.json never require a prior read.
bool default_read_exemption(const std::string& relPath);

/**
 * @brief Read-before-write policy knobs.
 */
struct PathPolicy {
    std::string workDir{kDefaultWorkDir};                   ///< Absolute project root
    std::function<bool(const std::string&)> isExempt{default_read_exemption}; ///< Receives normalized paths
};

/**
 * @brief Monotonic set of normalized paths.
 */
class PathSet {
public:
    explicit PathSet(std::string workDir = std::string(kDefaultWorkDir))
        : workDir_(std::move(workDir)) {}

    bool contains(std::string_view path) const;
    size_t size() const noexcept { return paths_.size(); }
    bool empty() const noexcept { return paths_.empty(); }
    std::vector<std::string> paths() const { return {paths_.begin(), paths_.end()}; } ///< Sorted
    const std::string& workDir() const noexcept { return workDir_; }

protected:
    bool insert_(std::string_view path);

private:
    std::string workDir_;
    std::set<std::string> paths_{};
};

/**
 * @brief Paths whose content has been disclosed to the model in this session.
 */
class ReadSet : public PathSet {
public:
    using PathSet::PathSet;

    /// Idempotent; returns true when the path was not recorded before.
    bool recordRead(std::string_view path) { return insert_(path); }
};

/**
 * @brief Paths already written in this session.
 */
class UpdatedSet : public PathSet {
public:
    using PathSet::PathSet;

    bool recordUpdate(std::string_view path) { return insert_(path); }
};

/**
 * @brief Read-only view of the collaborator-owned file map.
 */
class FileStore {
public:
    virtual ~FileStore() = default;
    /// Content of a normalized path, or nullopt when the file does not exist.
    virtual std::optional<std::string> getContents(const std::string& path) const = 0;
};

class InMemoryFileStore : public FileStore {
public:
    explicit InMemoryFileStore(std::string workDir = std::string(kDefaultWorkDir))
        : workDir_(std::move(workDir)) {}

    void put(std::string_view path, std::string content);
    bool erase(std::string_view path);
    size_t size() const noexcept { return files_.size(); }

    std::optional<std::string> getContents(const std::string& path) const override;

private:
    std::string workDir_;
    std::unordered_map<std::string, std::string> files_{};
};

} // namespace core
} // namespace actionstream
