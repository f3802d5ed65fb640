#include "stripper.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <cassert>
#include <cstddef>

namespace unfence {

class stripper::pass
{
private:
    static constexpr std::string_view fence{"```"};

    std::ostream& _err_stream;
    const config _cfg;
    const std::string_view _source;
    std::size_t _curr_idx;
    std::size_t _line_idx;
    std::size_t _curr_line;
    stats _stats;

    void copy_range(std::string& output_buffer, const std::size_t start_idx,
        const std::size_t end_idx)
    {
        assert(end_idx <= _source.size());
        assert(start_idx <= end_idx);

        output_buffer.append(_source.data() + start_idx, end_idx - start_idx);
    }

    [[nodiscard]] std::optional<std::size_t> find_fence(
        const std::size_t start_idx) const noexcept
    {
        const std::size_t idx = _source.find(fence, start_idx);

        if (idx == std::string_view::npos)
        {
            return std::nullopt;
        }

        return {idx};
    }

    [[nodiscard]] static bool is_tag_character(const char c) noexcept
    {
        return c != '\n' && c != '`';
    }

    // 1-based line of `idx`. Only ever queried with non-decreasing indices.
    [[nodiscard]] std::size_t line_of(const std::size_t idx)
    {
        assert(idx >= _line_idx);

        for (; _line_idx < idx; ++_line_idx)
        {
            if (_source[_line_idx] == '\n')
            {
                ++_curr_line;
            }
        }

        return _curr_line;
    }

    [[nodiscard]] std::ostream& warning_diagnostic_stream(
        const std::size_t idx)
    {
        return _err_stream << "((UNFENCE WARNING))(" << line_of(idx) << "): ";
    }

    void on_rejected_fence(const std::size_t fence_idx)
    {
        ++_stats._n_rejected_fences;

        if (_cfg.report_rejected_fences)
        {
            warning_diagnostic_stream(fence_idx)
                << "Backtick in language tag, ``` fence left untouched\n\n";
        }
    }

    void on_unterminated_fence(const std::size_t fence_idx)
    {
        ++_stats._n_unterminated_fences;

        if (_cfg.report_unterminated_fences)
        {
            warning_diagnostic_stream(fence_idx)
                << "Missing closing ```, code block left untouched\n\n";
        }
    }

    // Returns the index right after the newline that ends the opening fence
    // line, or nothing if `fence_idx` does not start an opening fence.
    [[nodiscard]] std::optional<std::size_t> find_content_start(
        const std::size_t fence_idx)
    {
        const std::size_t tag_start_idx = fence_idx + fence.size();

        std::size_t i = tag_start_idx;
        while (i < _source.size() && is_tag_character(_source[i]))
        {
            ++i;
        }

        if (i == _source.size())
        {
            return std::nullopt;
        }

        if (_source[i] == '\n')
        {
            return {i + 1 /* newline */};
        }

        assert(_source[i] == '`');

        // An empty tag followed by a backtick is just a longer run, which
        // may still open a fence one character later.
        if (i != tag_start_idx)
        {
            on_rejected_fence(fence_idx);
        }

        return std::nullopt;
    }

public:
    [[nodiscard]] explicit pass(std::ostream& err_stream, const config& cfg,
        const std::string_view source) noexcept
        : _err_stream{err_stream},
          _cfg{cfg},
          _source{source},
          _curr_idx{0},
          _line_idx{0},
          _curr_line{1},
          _stats{}
    {}

    [[nodiscard]] stats strip(std::string& output_buffer) noexcept
    {
        std::size_t search_idx = 0;

        while (true)
        {
            const std::optional<std::size_t> fence_idx =
                find_fence(search_idx);

            if (!fence_idx.has_value())
            {
                break;
            }

            const std::optional<std::size_t> content_start_idx =
                find_content_start(*fence_idx);

            if (!content_start_idx.has_value())
            {
                search_idx = *fence_idx + 1;
                continue;
            }

            // First ``` after the opening line closes the block, whatever
            // the length of the opening run was.
            const std::optional<std::size_t> closing_idx =
                find_fence(*content_start_idx);

            if (!closing_idx.has_value())
            {
                // No later fence can be closed either.
                on_unterminated_fence(*fence_idx);
                break;
            }

            copy_range(output_buffer, _curr_idx, *fence_idx);
            copy_range(output_buffer, *content_start_idx, *closing_idx);
            ++_stats._n_stripped_blocks;

            _curr_idx = *closing_idx + fence.size();
            search_idx = _curr_idx;
        }

        copy_range(output_buffer, _curr_idx, _source.size());
        return _stats;
    }
};

stripper::stripper(std::ostream& err_stream) noexcept : _err_stream{err_stream}
{}

stripper::~stripper() = default;

stripper::stats stripper::strip(const config& cfg, std::string& output_buffer,
    const std::string_view source) noexcept
{
    return pass{_err_stream, cfg, source}.strip(output_buffer);
}

} // namespace unfence
