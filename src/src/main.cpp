// brufmt - check, reformat and inspect Bru request files

#include <bru/brufmt.h>
#include <bru/cli_args.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::string read_input(const std::string& path) {
    if (path == "-") {
        return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open file: " + path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void show_help() {
    std::cout << "brufmt - Parse, validate and format Bru request files\n\n";
    std::cout << "USAGE:\n";
    std::cout << "  brufmt [OPTIONS] <file>\n";
    std::cout << "  brufmt --check <file>\n";
    std::cout << "  brufmt --format [--indent N] [--separator S] [--trailing-newline] [-o out] <file>\n";
    std::cout << "  brufmt --json [--indent N] <file>\n\n";
    std::cout << "ACTIONS:\n";
    std::cout << "  (default)                Parse the file and list its blocks\n";
    std::cout << "  --check                  Validate only; exit 1 on the first syntax error\n";
    std::cout << "  --format                 Decode and re-encode the file\n";
    std::cout << "  --json                   Print the blocks as JSON\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  --indent N               Indentation width (default 2)\n";
    std::cout << "  --separator S            Entry separator read and written: '' (default) or ','\n";
    std::cout << "  --array-separator S      Separator for array blocks only\n";
    std::cout << "  --trailing-newline       Keep a newline after the last block\n";
    std::cout << "  --output, -o <path>      Write output to a file instead of stdout\n";
    std::cout << "  --verbose, -v            Report progress on stderr\n";
    std::cout << "  --help, -h               Show this help\n\n";
    std::cout << "Use '-' as <file> to read from standard input.\n";
}

std::string shorten(const std::string& s, size_t n = 40) {
    std::string flat;
    for (char c : s) flat.push_back(c == '\n' ? ' ' : c);
    if (flat.size() <= n) return flat;
    return flat.substr(0, n - 3) + "...";
}

std::string preview(const bru::Block& block) {
    std::ostringstream ss;
    ss << bru::block_tag(block) << " {" << bru::kind_name(bru::block_kind(block));
    switch (bru::block_kind(block)) {
        case bru::BlockKind::Dictionary: {
            const auto& entries = std::get<bru::DictionaryBlock>(block).content;
            ss << ", " << entries.size() << " entries}";
            size_t shown = 0;
            for (auto const& e : entries) {
                if (shown++ >= 3) break;
                ss << (shown == 1 ? " " : ", ") << e.key << "=" << shorten(e.value);
            }
            if (entries.size() > 3) ss << ", ...";
            break;
        }
        case bru::BlockKind::Array: {
            const auto& values = std::get<bru::ArrayBlock>(block).content;
            ss << ", " << values.size() << " items}";
            size_t shown = 0;
            for (auto const& v : values) {
                if (shown++ >= 3) break;
                ss << (shown == 1 ? " " : ", ") << shorten(v);
            }
            if (values.size() > 3) ss << ", ...";
            break;
        }
        case bru::BlockKind::Text: {
            const auto& text = std::get<bru::TextBlock>(block).content;
            ss << ", " << text.size() << " bytes} " << shorten(text);
            break;
        }
    }
    return ss.str();
}

int write_output(const bru::CliArgs& args, const std::string& text) {
    if (!args.hasOutputPath()) {
        std::cout << text;
        return 0;
    }
    std::ofstream out(args.getOutputPath(), std::ios::binary);
    if (!out) {
        std::cerr << "error: cannot open output: " << args.getOutputPath() << "\n";
        return 2;
    }
    out << text;
    out.flush();
    if (!out) {
        std::cerr << "error: cannot write output: " << args.getOutputPath() << "\n";
        return 2;
    }
    return 0;
}

}  // namespace

int main(int argc, const char* argv[]) {
    try {
        bru::CliArgs args(argc, argv);

        if (args.getAction() == bru::CliArgs::Action::HELP) {
            show_help();
            return 0;
        }

        const bool verbose = args.isVerbose();
        std::string content;
        try {
            content = read_input(args.getFilePath());
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 2;
        }
        if (verbose) std::cerr << "brufmt: read " << content.size() << " bytes from " << args.getFilePath() << "\n";

        try {
            switch (args.getAction()) {
                case bru::CliArgs::Action::CHECK: {
                    bru::validate_bru(content);
                    if (verbose) std::cerr << "brufmt: validation passed\n";
                    std::cout << "OK: " << args.getFilePath() << " is valid Bru\n";
                    return 0;
                }

                case bru::CliArgs::Action::FORMAT: {
                    // Reject bad encoder options before touching the input.
                    bru::Encoder encoder(args.getEncodeOptions());
                    // the input is read with the separator it is written with
                    bru::DecodeOptions decode_options;
                    decode_options.separator = encoder.options().separator;
                    auto blocks = bru::parse_bru(content, decode_options);
                    if (verbose) {
                        const auto& o = encoder.options();
                        std::cerr << "brufmt: decoded " << blocks.size() << " blocks; encoding with indent "
                                  << o.indent << ", separator '" << o.separator << "', array separator '"
                                  << o.array_separator.value_or(o.separator) << "', trailing newline "
                                  << (o.trailing_newline ? "on" : "off") << "\n";
                    }
                    return write_output(args, encoder.encode(blocks));
                }

                case bru::CliArgs::Action::JSON: {
                    auto blocks = bru::parse_bru(content);
                    if (verbose) std::cerr << "brufmt: decoded " << blocks.size() << " blocks\n";
                    return write_output(args, bru::dump_json(blocks, args.getIndent()) + "\n");
                }

                case bru::CliArgs::Action::SUMMARY: {
                    auto blocks = bru::parse_bru(content);
                    std::cout << "OK: parsed " << blocks.size() << " blocks\n";
                    for (auto const& b : blocks) std::cout << "  " << preview(b) << "\n";
                    return 0;
                }

                case bru::CliArgs::Action::HELP:
                    // Already handled above
                    return 0;
            }
        } catch (const bru::SyntaxError& e) {
            std::cerr << "parse error: " << e.what() << " (offset " << e.offset << ")\n";
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Try 'brufmt --help' for usage.\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
