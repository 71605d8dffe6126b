#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "action.hpp"
#include "read_set.hpp"

namespace actionstream {
namespace core {

inline constexpr std::string_view kNeedReadFiles     = "NEED_READ_FILES";
inline constexpr std::string_view kUseFileAction     = "USE_FILE_ACTION";
inline constexpr std::string_view kBeforeTextMissing = "BEFORE_TEXT_NOT_FOUND";
inline constexpr std::string_view kForbiddenCommand  = "FORBIDDEN_COMMAND";

inline constexpr std::string_view kReadThenResubmit  = "read-then-resubmit";

/**
 * @brief Acceptance or structured rejection of a submission.
 */
struct SubmissionVerdict {
    bool accepted{true};
    std::string errorCode{};                 ///< One of the k* codes above when rejected
    std::vector<std::string> missingPaths{}; ///< NEED_READ_FILES: sorted, normalized
    std::string remediation{};               ///< Action the caller should take
    std::string path{};                      ///< Offending path (modify checks)
    std::vector<size_t> invalidEdits{};      ///< BEFORE_TEXT_NOT_FOUND: edit indexes
    std::string message{};                   ///< Human readable summary

    explicit operator bool() const noexcept { return accepted; }
};

/**
 * @brief Read-before-write gate for one orchestration session.
 *
 * Pure set comparison against the supplied file store and session sets; the
 * gate keeps references and never performs I/O or mutates them.
 */
class ValidationGate {
public:
    ValidationGate(const FileStore& files, const ReadSet& reads, const UpdatedSet& updates,
                   PathPolicy policy = {});

    /// True when the path exists in the file store and is not exempt.
    bool requiresRead(std::string_view path) const;

    /// NEED_READ_FILES with the sorted (pre-existing ∩ referenced) \ read paths.
    SubmissionVerdict checkSubmission(const std::vector<ActionTag>& actions) const;

    /// USE_FILE_ACTION / BEFORE_TEXT_NOT_FOUND for one modify action.
    SubmissionVerdict checkModify(const ActionTag& action) const;

    /// FORBIDDEN_COMMAND for destructive or long-running shell commands.
    SubmissionVerdict checkShellCommand(std::string_view command) const;

    /// checkSubmission, then the per-action checks in order; first rejection wins.
    SubmissionVerdict check(const std::vector<ActionTag>& actions) const;

    const PathPolicy& policy() const noexcept { return policy_; }

private:
    const FileStore& files_;
    const ReadSet& reads_;
    const UpdatedSet& updates_;
    PathPolicy policy_;
};

} // namespace core
} // namespace actionstream
