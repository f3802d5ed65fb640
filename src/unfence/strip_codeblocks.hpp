#pragma once

#include <string>
#include <string_view>

namespace unfence {

/// Removes the ``` fences (and their optional language tag) of every fenced
/// code block in `text`, keeping the enclosed content verbatim. Inline code
/// spans are left untouched.
[[nodiscard]] std::string strip_codeblocks(const std::string_view text);

} // namespace unfence
