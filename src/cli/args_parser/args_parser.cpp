#include "args_parser.hpp"
#include <CLI/CLI.hpp>

namespace copysort::args_parser {

std::expected<CLIArgs, int> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    bool no_progress = false;

    CLI::App app{"Incrementally copy a tree, sorting photos and videos by capture date"};
    app.set_version_flag("--version", [&args]() {
        args.version = true;
        return std::string{};
    });

    // Несуществующий источник не ошибка разбора: обход просто ничего не найдёт
    app.add_option("source_dir", args.source, "Directory to copy from")
        ->required();
    app.add_option("dest_dir", args.destination, "Directory to copy into")
        ->required();
    app.add_option("--manifest", args.manifest,
                   "Path to manifest file (default $HOME/.copy_sort_manifest.txt)");
    app.add_option("-j,--workers", args.workers, "Number of parallel workers (default 8)")
        ->check(CLI::PositiveNumber);
    app.add_option("--buffer-size", args.buffer_size, "Copy buffer size in bytes")
        ->check(CLI::PositiveNumber);
    app.add_flag("--no-progress", no_progress, "Do not draw the progress bar");
    auto* quiet = app.add_flag("-q,--quiet", args.quiet, "Only print warnings and errors");
    app.add_flag("-v,--verbose", args.verbose, "Log why individual files were skipped")
        ->excludes(quiet);

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForVersion&) {
        return args;
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    args.progress = !no_progress;
    return args;
}

} // namespace copysort::args_parser
