#include "config/config.hpp"
#include "output/row_dump.hpp"
#include "processing/patch_parser.hpp"
#include "review/comment_threads.hpp"
#include "rows/side_by_side_rows.hpp"
#include "rows/unified_rows.hpp"
#include "util/read_file.hpp"
#include "util/tty.hpp"
#include "view/hunk_folding.hpp"
#include "view/navigation.hpp"
#include "view/search.hpp"
#include "view/virtual_window.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

enum class FileStatus {
    kOk,
    kFileDoesNotExist,
    kFileNotReadable,
};

FileStatus
check_file_status(const std::string& path) {
    std::error_code ec;
    fs::path file_path(path);

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }
    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }
    return FileStatus::kOk;
}

std::string
to_string(const FileStatus status) {
    switch (status) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
    }
    return "Unknown error";
}

template <typename Int>
bool
parse_number(std::string_view s, Int& value) {
    if (s.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    return ec == std::errc() && ptr == s.data() + s.size();
}

bool
parse_fold_list(std::string_view s, std::vector<std::size_t>& hunks) {
    while (!s.empty()) {
        const auto comma = s.find(',');
        std::size_t hunk = 0;
        if (!parse_number(s.substr(0, comma), hunk)) {
            return false;
        }
        hunks.push_back(hunk);
        if (comma == std::string_view::npos) {
            break;
        }
        s.remove_prefix(comma + 1);
    }
    return true;
}

std::string
format_position(const std::optional<std::size_t>& row) {
    return row ? fmt::format("{}", *row) : "none";
}

struct PatchReport {
    std::string filename;
    std::string patch;
    std::vector<revdiff::Hunk> hunks;
};

// Everything printed for a single patch, in one layout.
template <typename Rows>
void
report_rows(const revdiff::ProgramOptions& opts, const Rows& rows, const std::string& filename, int viewport_rows) {
    using namespace revdiff;

    if (opts.goto_line_set) {
        fmt::print("{}: line {} -> row {}\n", filename, opts.goto_line,
                   format_position(find_row_by_line_number(rows, opts.goto_line)));
    }

    if (opts.jump_from_set) {
        fmt::print("{}: from row {}: next hunk {}, previous hunk {}\n", filename, opts.jump_from,
                   format_position(find_next_hunk_start(rows, opts.jump_from)),
                   format_position(find_prev_hunk_start(rows, opts.jump_from)));
    }

    if (!opts.search_query.empty()) {
        const auto matches = compute_search_matches(rows, opts.search_query);
        fmt::print("{}: {} match(es) for '{}':", filename, matches.size(), opts.search_query);
        for (const auto row : matches) {
            fmt::print(" {}", row);
        }
        fmt::print("\n");
    }

    if (opts.goto_line_set || opts.jump_from_set || !opts.search_query.empty()) {
        return;
    }

    FoldState folded(opts.folded_hunks.begin(), opts.folded_hunks.end());
    const auto visible = apply_hunk_folding(rows, folded);
    const auto total = static_cast<int64_t>(visible.size());

    VirtualWindowInput input;
    input.total_items = total;
    input.viewport_size = viewport_rows > 0 ? viewport_rows : total;
    input.scroll_offset = opts.scroll_offset;
    input.overscan = opts.overscan;
    const auto window = compute_virtual_window(input);

    RowRenderOptions render_options;
    render_options.color = tty_supports_color();
    render_options.tab_width = static_cast<std::size_t>(opts.tab_width);

    int term_rows = 0;
    int term_cols = 0;
    if (tty_get_term_size(&term_rows, &term_cols) && term_cols > 40) {
        // Two columns of line number, prefix and text plus the separator.
        render_options.column_width = static_cast<std::size_t>((term_cols - 3) / 2 - 7);
    }

    fmt::print("==> {} <==\n", filename);
    for (const auto& line : render_rows(visible, static_cast<std::size_t>(window.start_index),
                                        static_cast<std::size_t>(window.end_index), render_options)) {
        fmt::print("{}\n", line);
    }
    if (window.padding_top > 0 || window.padding_bottom > 0) {
        fmt::print("-- rows {}-{} of {} ({} above, {} below) --\n", window.start_index, window.end_index, total,
                   window.padding_top, window.padding_bottom);
    }
}

}  // namespace

int
main(int argc, char* argv[]) {
    revdiff::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] patch_file [patch_file...]

Render review diffs with inline comment threads.

Options:
    -s, --side-by-side          side-by-side layout
    -u, --unified               unified layout
    -c, --comments [file]       review comments to show below their lines
    -p, --path [name]           only show comments for this path
                                (default: each patch file's name)
    -q, --search [query]        list rows matching the query, and matches
                                across all given patches
    -g, --goto [line]           print the row showing the given line number
    -j, --jump-from [row]       print the next and previous hunk from a row
    -F, --fold [list]           comma separated hunk indices to fold
    -o, --scroll [offset]       first row of the printed window
    -r, --rows [count]          rows per window (default: terminal height)
    -l, --line                  line based diff instead of word based diff
    -v, --version               show program version and exit
    -h, --help                  show this help
)",
                                       argv[0]);

        help += "\n";
        help += "Config directory:\n    " + revdiff::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
        }
        puts(help.c_str());
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"side-by-side", no_argument, 0, 's'},
                                               {"unified", no_argument, 0, 'u'},
                                               {"comments", required_argument, 0, 'c'},
                                               {"path", required_argument, 0, 'p'},
                                               {"search", required_argument, 0, 'q'},
                                               {"goto", required_argument, 0, 'g'},
                                               {"jump-from", required_argument, 0, 'j'},
                                               {"fold", required_argument, 0, 'F'},
                                               {"scroll", required_argument, 0, 'o'},
                                               {"rows", required_argument, 0, 'r'},
                                               {"line", no_argument, 0, 'l'},
                                               {0, 0, 0, 0}};
        bool unified = false;
        bool side_by_side = false;

        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvsuc:p:q:g:j:F:o:r:l", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", REVDIFF_VERSION);
                    exit(0);
                case 'h':
                    opts.help = true;
                    return true;
                case 's':
                    side_by_side = true;
                    break;
                case 'u':
                    unified = true;
                    break;
                case 'c':
                    opts.comments_file = optarg;
                    break;
                case 'p':
                    opts.comments_path = optarg;
                    break;
                case 'q':
                    opts.search_query = optarg;
                    break;
                case 'l':
                    opts.word_diff = false;
                    break;
                case 'g':
                    if (!parse_number(optarg, opts.goto_line)) {
                        show_help(fmt::format("error: invalid line number for -g ({})\n", optarg));
                        return false;
                    }
                    opts.goto_line_set = true;
                    break;
                case 'j':
                    if (!parse_number(optarg, opts.jump_from)) {
                        show_help(fmt::format("error: invalid row for -j ({})\n", optarg));
                        return false;
                    }
                    opts.jump_from_set = true;
                    break;
                case 'F':
                    if (!parse_fold_list(optarg, opts.folded_hunks)) {
                        show_help(fmt::format("error: invalid hunk list for -F ({})\n", optarg));
                        return false;
                    }
                    break;
                case 'o':
                    if (!parse_number(optarg, opts.scroll_offset)) {
                        show_help(fmt::format("error: invalid value for -o ({})\n", optarg));
                        return false;
                    }
                    break;
                case 'r':
                    if (!parse_number(optarg, opts.viewport_rows) || opts.viewport_rows < 1) {
                        show_help(fmt::format("error: invalid value for -r ({})\n", optarg));
                        return false;
                    }
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        if (unified && side_by_side) {
            show_help("error: -s and -u are mutually exclusive");
            return false;
        } else if (unified) {
            opts.diff_mode = revdiff::DiffMode::kUnified;
        } else if (side_by_side) {
            opts.diff_mode = revdiff::DiffMode::kSideBySide;
        }

        if (argc - optind < 1) {
            show_help("error: missing patch file");
            return false;
        }

        std::string err;
        for (int i = optind; i < argc; i++) {
            const auto status = check_file_status(argv[i]);
            if (status != FileStatus::kOk) {
                err += fmt::format("File '{}': {}\n", argv[i], to_string(status));
            }
            opts.patch_files.push_back(argv[i]);
        }
        if (!opts.comments_file.empty()) {
            const auto status = check_file_status(opts.comments_file);
            if (status != FileStatus::kOk) {
                err += fmt::format("Comments file '{}': {}\n", opts.comments_file, to_string(status));
            }
        }
        if (!err.empty()) {
            show_help(err);
            return false;
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    revdiff::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return -1;
    }

    if (opts.help) {
        show_help("");
        return 0;
    }

    revdiff::CommentsFile comments_file;
    if (!opts.comments_file.empty()) {
        std::string contents;
        if (!revdiff::read_file(opts.comments_file, contents)) {
            return 1;
        }
        revdiff::CommentsParseResult parse_result;
        if (!revdiff::parse_comments_file(contents, parse_result, comments_file)) {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", parse_result.error, opts.comments_file);
            return 1;
        }
    }

    std::vector<PatchReport> reports;
    for (const auto& path : opts.patch_files) {
        PatchReport report;
        report.filename = path;
        if (!revdiff::read_file(path, report.patch)) {
            return 1;
        }
        report.hunks = revdiff::parse_patch(report.patch);
        if (report.hunks.empty() && !report.patch.empty()) {
            fmt::print(stderr, "warning: no hunks found in {}\n", path);
        }
        reports.push_back(std::move(report));
    }

    int viewport_rows = static_cast<int>(opts.viewport_rows);
    if (viewport_rows <= 0) {
        int term_cols = 0;
        if (!revdiff::tty_get_term_size(&viewport_rows, &term_cols)) {
            viewport_rows = 0;
        }
    }

    revdiff::RowBuildOptions build_options;
    build_options.word_diff = opts.word_diff;

    for (const auto& report : reports) {
        const std::string comments_path = opts.comments_path.empty() ? report.filename : opts.comments_path;
        if (!comments_file.comments.empty() && !revdiff::has_comments_for_path(comments_file.comments, comments_path)) {
            fmt::print(stderr, "warning: no comment in {} is on path '{}' (select one with -p)\n",
                       opts.comments_file, comments_path);
        }
        const auto comments =
            revdiff::build_comment_map(comments_file.comments, comments_file.threads, comments_path);

        if (opts.diff_mode == revdiff::DiffMode::kSideBySide) {
            const auto rows = revdiff::build_side_by_side_rows(report.hunks, &comments, build_options);
            report_rows(opts, rows, report.filename, viewport_rows);
        } else {
            const auto rows = revdiff::build_diff_rows(report.hunks, &comments, build_options);
            report_rows(opts, rows, report.filename, viewport_rows);
        }
    }

    if (!opts.search_query.empty() && reports.size() > 1) {
        std::vector<revdiff::PatchFile> files;
        for (const auto& report : reports) {
            files.push_back({report.filename, report.patch});
        }
        const auto matches = revdiff::build_cross_file_matches(files, opts.search_query);
        fmt::print("{} match(es) in {} file(s):\n", matches.size(), revdiff::count_matched_files(matches));
        for (const auto& match : matches) {
            fmt::print("  {}:{}: {}\n", match.filename, match.line_index, match.line_content);
        }
    }

    return 0;
}
