#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include <cstddef>

namespace unfence {

class stripper
{
private:
    class pass;

    std::ostream& _err_stream;

public:
    struct config
    {
        bool report_unterminated_fences = false;
        bool report_rejected_fences = false;
    };

    struct stats
    {
        std::size_t _n_stripped_blocks = 0;
        std::size_t _n_unterminated_fences = 0;
        std::size_t _n_rejected_fences = 0;
    };

    [[nodiscard]] explicit stripper(std::ostream& err_stream) noexcept;
    ~stripper();

    // Appends `source` to `output_buffer`, replacing every fenced code block
    // with its content. Never fails.
    [[nodiscard]] stats strip(const config& cfg, std::string& output_buffer,
        const std::string_view source) noexcept;
};

} // namespace unfence
