#include "../include/validation_gate.hpp"
#include "../include/dev_debug.hpp"
#include "../include/helpers.h"
#include "../include/text_codec.hpp"

#include <array>
#include <set>

using namespace _ActionStreamHelpers;

namespace actionstream {
namespace core {

namespace {

SubmissionVerdict reject(std::string_view code, std::string remediation, std::string message) {
    SubmissionVerdict v;
    v.accepted = false;
    v.errorCode.assign(code.data(), code.size());
    v.remediation = std::move(remediation);
    v.message = std::move(message);
    return v;
}

constexpr std::array<std::string_view, 4> kRunners{"npm run", "yarn run", "pnpm run", "bun run"};

} // namespace

ValidationGate::ValidationGate(const FileStore& files, const ReadSet& reads, const UpdatedSet& updates,
                               PathPolicy policy)
    : files_(files)
    , reads_(reads)
    , updates_(updates)
    , policy_(std::move(policy))
{
}

bool ValidationGate::requiresRead(std::string_view path) const {
    const std::string p = normalize_path(path, policy_.workDir);
    if (policy_.isExempt && policy_.isExempt(p)) return false;
    return files_.getContents(p).has_value();
}

SubmissionVerdict ValidationGate::checkSubmission(const std::vector<ActionTag>& actions) const {
    std::set<std::string> missing;
    for (const auto& a : actions) {
        if (a.type() == ActionType::Shell) continue;
        const std::string p = normalize_path(a.path(), policy_.workDir);
        if (p.empty() || !requiresRead(p) || reads_.contains(p)) continue;
        missing.insert(p);
    }
    if (missing.empty()) return {};

    ASTREAM_DBG("GATE", "submission rejected: %zu unread paths", missing.size());
    SubmissionVerdict v = reject(kNeedReadFiles, std::string(kReadThenResubmit),
                                 "Existing files must be read before they are written or modified");
    v.missingPaths.assign(missing.begin(), missing.end());
    return v;
}

SubmissionVerdict ValidationGate::checkModify(const ActionTag& action) const {
    const auto* m = std::get_if<ModifyAction>(&action.payload);
    if (!m) return {};

    const std::string p = normalize_path(m->path, policy_.workDir);
    if (updates_.contains(p)) {
        ASTREAM_DBG("GATE", "modify rejected: %s already updated", p.c_str());
        SubmissionVerdict v = reject(kUseFileAction, "resubmit-as-file-action",
                                     "File was already modified in this session; submit the complete content instead");
        v.path = p;
        return v;
    }

    auto content = files_.getContents(p);
    if (!content) return {};

    const bool markdown = ends_with(p, ".md");
    std::vector<size_t> invalid;
    for (size_t i = 0; i < m->edits.size(); ++i) {
        const std::string& before = m->edits[i].before;
        bool found = !before.empty() && content->find(before) != std::string::npos;
        if (!found && !before.empty() && !markdown) {
            found = content->find(decode_entities(before)) != std::string::npos;
        }
        if (!found) invalid.push_back(i);
    }
    if (invalid.empty()) return {};

    ASTREAM_DBG("GATE", "modify rejected: %zu of %zu edits not found in %s",
                invalid.size(), m->edits.size(), p.c_str());
    SubmissionVerdict v = reject(kBeforeTextMissing, "copy-exact-before-text",
                                 "Some 'before' texts do not exist in the file");
    v.path = p;
    v.invalidEdits = std::move(invalid);
    return v;
}

SubmissionVerdict ValidationGate::checkShellCommand(std::string_view command) const {
    const std::string_view cmd = trim_view(command);
    bool forbidden = cmd.find("rm -rf") != std::string_view::npos ||
                     cmd.find('*') != std::string_view::npos;
    for (auto runner : kRunners) {
        if (cmd.starts_with(runner)) forbidden = true;
    }
    if (!forbidden) return {};

    ASTREAM_DBG("GATE", "shell command rejected: %.*s", static_cast<int>(cmd.size()), cmd.data());
    return reject(kForbiddenCommand, "choose-another-command",
                  "Command is not allowed; only package installs and single file removal are permitted");
}

SubmissionVerdict ValidationGate::check(const std::vector<ActionTag>& actions) const {
    SubmissionVerdict v = checkSubmission(actions);
    if (!v) return v;

    for (const auto& a : actions) {
        if (const auto* s = std::get_if<ShellAction>(&a.payload)) {
            // Start commands launch the dev server and are exempt from the runner rule.
            if (!s->start) v = checkShellCommand(s->command);
        } else {
            v = checkModify(a);
        }
        if (!v) return v;
    }
    return v;
}

} // namespace core
} // namespace actionstream
