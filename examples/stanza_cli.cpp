#include <print>
#include <fstream>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "stanza/stanza.hpp"

namespace {

    constexpr int exit_ok = 0;
    constexpr int exit_transform_failed = 1;
    constexpr int exit_bad_input = 2;
    constexpr int exit_usage = 64;

    struct CliOptions {
        Stanza::WriteOptions write{};
        Stanza::ParseOptions parse{};
        std::string log_level = "warn";
        std::string output{};
        std::vector<std::string> files{};
        bool help = false;
    };

    void print_usage() {
        std::println(stderr,
            "usage: stanza-cli [options] <source.json> <spec.json>\n"
            "\n"
            "Applies a shift spec (an operation or a list of operations) to a JSON document.\n"
            "\n"
            "options:\n"
            "  --pretty              indent the output\n"
            "  --indent N            spaces per level with --pretty (default 2)\n"
            "  --sort-keys           write object keys in lexicographic order\n"
            "  --allow-comments      accept // and /* */ comments in both inputs\n"
            "  --log-level LEVEL     trace, debug, info, warn, error or off (default warn)\n"
            "  -o FILE               write the result to FILE instead of stdout\n"
            "  --help                show this message");
    }

    std::optional<CliOptions> parse_args(int argc, char** argv) {
        CliOptions opts;
        for (int i = 1; i < argc; i++) {
            std::string_view arg = argv[i];
            auto next = [&]() -> std::optional<std::string_view> {
                if (i + 1 >= argc) {
                    spdlog::error("option '{}' needs a value", arg);
                    return std::nullopt;
                }
                return std::string_view{ argv[++i] };
            };

            if (arg == "--help" || arg == "-h") {
                opts.help = true;
            } else if (arg == "--pretty") {
                opts.write.pretty = true;
            } else if (arg == "--sort-keys") {
                opts.write.sort_keys = true;
            } else if (arg == "--allow-comments") {
                opts.parse.allow_comments = true;
            } else if (arg == "--indent") {
                auto v = next();
                if (!v) return std::nullopt;
                size_t n = 0;
                auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
                if (ec != std::errc{} || ptr != v->data() + v->size()) {
                    spdlog::error("--indent expects a number, got '{}'", *v);
                    return std::nullopt;
                }
                opts.write.indent = n;
            } else if (arg == "--log-level") {
                auto v = next();
                if (!v) return std::nullopt;
                opts.log_level = *v;
            } else if (arg == "-o") {
                auto v = next();
                if (!v) return std::nullopt;
                opts.output = *v;
            } else if (arg.starts_with('-') && arg != "-") {
                spdlog::error("unknown option '{}'", arg);
                return std::nullopt;
            } else {
                opts.files.emplace_back(arg);
            }
        }
        return opts;
    }

    std::optional<Stanza::value> load(const std::string& file, const Stanza::ParseOptions& opts) {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs) {
            std::println(stderr, "{}: cannot open file", file);
            return std::nullopt;
        }

        auto r = Stanza::parse(ifs, opts);
        if (!r) {
            std::println(stderr, "{}:{}:{}: {}", file, r.error().line, r.error().column, r.error().msg);
            return std::nullopt;
        }
        return std::move(*r);
    }

} // namespace

int main(int argc, char** argv) {
    auto logger = spdlog::stderr_color_mt("stanza");
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return exit_usage;
    }
    if (opts->help) {
        print_usage();
        return exit_ok;
    }
    if (opts->files.size() != 2) {
        spdlog::error("expected a source file and a spec file, got {} argument(s)", opts->files.size());
        print_usage();
        return exit_usage;
    }

    auto level = spdlog::level::from_str(opts->log_level);
    if (level == spdlog::level::off && opts->log_level != "off") {
        spdlog::error("unknown log level '{}'", opts->log_level);
        return exit_usage;
    }
    logger->set_level(level);

    auto source = load(opts->files[0], opts->parse);
    auto spec = load(opts->files[1], opts->parse);
    if (!source || !spec) return exit_bad_input;

    auto result = Stanza::transform(*source, *spec, { .logger = logger });
    if (!result) {
        spdlog::error("{}", result.error().what());
        return exit_transform_failed;
    }

    std::string text = Stanza::dump(*result, opts->write);
    if (opts->output.empty()) {
        std::println("{}", text);
        return exit_ok;
    }

    std::ofstream ofs(opts->output, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        spdlog::error("{}: cannot open file for writing", opts->output);
        return exit_transform_failed;
    }
    std::println(ofs, "{}", text);
    return exit_ok;
}
