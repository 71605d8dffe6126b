#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "action.hpp"

namespace actionstream {
namespace core {

/**
 * @brief Outcome of apply_edits().
 */
struct EditResult {
    bool success{true};                   ///< All edits applied
    std::string content{};                ///< Resulting content (input content on failure)
    size_t applied{0};                    ///< Edits applied before stopping
    std::optional<size_t> failedIndex{};  ///< First edit whose `before` text was not found
    size_t entityFallbacks{0};            ///< Edits that only matched after entity decoding
};

/// Applies edits in order, each replacing the first occurrence of its `before`
/// text. When `before` is absent but its entity-decoded form is present, the
/// decoded `before`/`after` pair is used instead. Stops at the first miss.
EditResult apply_edits(std::string_view content, const std::vector<Edit>& edits);

} // namespace core
} // namespace actionstream
