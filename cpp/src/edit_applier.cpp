#include "../include/edit_applier.hpp"
#include "../include/dev_debug.hpp"
#include "../include/text_codec.hpp"

namespace actionstream {
namespace core {

namespace {

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

} // namespace

EditResult apply_edits(std::string_view content, const std::vector<Edit>& edits) {
    EditResult r;
    std::string current(content);

    for (size_t i = 0; i < edits.size(); ++i) {
        std::string before = edits[i].before;
        std::string after  = edits[i].after;

        size_t pos = before.empty() ? std::string::npos : current.find(before);
        if (pos == std::string::npos) {
            std::string decoded = decode_entities(before);
            if (!decoded.empty() && decoded != before) {
                pos = current.find(decoded);
                if (pos != std::string::npos) {
                    ASTREAM_DBG("GATE", "apply_edits: edit #%zu matched after entity decoding", i);
                    before = std::move(decoded);
                    after  = decode_entities(after);
                    ++r.entityFallbacks;
                }
            }
        }
        if (pos == std::string::npos) {
            ASTREAM_DBG("GATE", "apply_edits: edit #%zu not found (%zu bytes)", i, edits[i].before.size());
            r.success = false;
            r.failedIndex = i;
            r.content = std::string(content);
            return r;
        }

        const size_t occurrences = count_occurrences(current, before);
        if (occurrences > 1) {
            ASTREAM_DBG("GATE", "apply_edits: edit #%zu matches %zu times, replacing the first", i, occurrences);
        }
        current.replace(pos, before.size(), after);
        ++r.applied;
    }

    r.content = std::move(current);
    return r;
}

} // namespace core
} // namespace actionstream
