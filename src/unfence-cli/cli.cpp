#include "cli.hpp"

#include <unfence/stripper.hpp>

#include <fstream>
#include <istream>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace unfence {

namespace {

[[nodiscard]] std::ostream& error_diagnostic_stream(std::ostream& err)
{
    return err << "((UNFENCE ERROR))(?): ";
}

[[nodiscard]] bool read_stream_in_buffer(std::istream& is, std::string& buffer)
{
    buffer.assign(std::istreambuf_iterator<char>{is},
        std::istreambuf_iterator<char>{});

    return !is.bad();
}

// No size probe: pipes and `/dev/fd/N` paths cannot seek.
[[nodiscard]] bool read_file_in_buffer(std::ostream& err,
    const std::string_view path, std::string& buffer)
{
    std::ifstream ifs(std::string{path}, std::ios::binary);
    if (!ifs)
    {
        error_diagnostic_stream(err)
            << "Failed to open file '" << path << "'\n\n";

        return false;
    }

    if (!read_stream_in_buffer(ifs, buffer))
    {
        error_diagnostic_stream(err)
            << "Failed to read file '" << path << "'\n\n";

        return false;
    }

    return true;
}

void print_usage(std::ostream& err, const char* program_name)
{
    err << "Usage: " << program_name << " [-w|--warn] [FILE]\n"
        << "Strips ``` fences from markdown read from FILE or stdin.\n";
}

} // namespace

int run_cli(int argc, const char* const* argv, std::istream& in,
    std::ostream& out, std::ostream& err)
{
    const char* const program_name = argc > 0 ? argv[0] : "unfence-cli";

    bool warn = false;
    std::optional<std::string_view> input_path;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};

        if (arg == "-w" || arg == "--warn")
        {
            warn = true;
            continue;
        }

        if (arg == "-h" || arg == "--help")
        {
            print_usage(err, program_name);
            return 0;
        }

        if (arg.size() > 1 && arg.front() == '-')
        {
            error_diagnostic_stream(err) << "Unknown option '" << arg << "'\n\n";
            print_usage(err, program_name);
            return 1;
        }

        if (input_path.has_value())
        {
            error_diagnostic_stream(err) << "More than one input file given\n\n";
            print_usage(err, program_name);
            return 1;
        }

        input_path = arg;
    }

    std::string input_buffer;

    if (!input_path.has_value() || *input_path == "-")
    {
        if (!read_stream_in_buffer(in, input_buffer))
        {
            error_diagnostic_stream(err) << "Failed to read stdin\n\n";
            return 2;
        }
    }
    else if (!read_file_in_buffer(err, *input_path, input_buffer))
    {
        return 2;
    }

    std::string output_buffer;
    output_buffer.reserve(input_buffer.size());

    const stripper::config cfg{
        .report_unterminated_fences = warn,
        .report_rejected_fences = warn //
    };

    stripper s{err};
    (void)s.strip(cfg, output_buffer, input_buffer);

    out << output_buffer << std::flush;
    return 0;
}

} // namespace unfence
