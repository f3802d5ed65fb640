#include "strip_codeblocks.hpp"

#include "stripper.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace unfence {

std::string strip_codeblocks(const std::string_view text)
{
    std::string output_buffer;
    output_buffer.reserve(text.size());

    // Default config never writes; a bufferless stream keeps it that way.
    std::ostream null_stream{nullptr};

    stripper s{null_stream};
    (void)s.strip(stripper::config{}, output_buffer, text);

    return output_buffer;
}

} // namespace unfence
