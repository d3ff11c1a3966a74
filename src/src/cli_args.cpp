#include <bru/cli_args.h>
#include <bru/cli_utils.h>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace bru {

static int parse_indent(const std::string& text) {
    if (text.empty() or text.size() > 3) throw std::invalid_argument("--indent requires a number between 0 and 999");
    for (char c : text) {
        if (not std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("--indent requires a number between 0 and 999");
        }
    }
    return std::stoi(text);
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    static const std::vector<std::string> valid_options = {
        "--help", "-h",
        "--check",
        "--format",
        "--json",
        "--indent",
        "--separator",
        "--array-separator",
        "--trailing-newline",
        "--output", "-o",
        "--verbose", "-v"
    };

    if (argc <= 1) {
        action_ = Action::HELP;
        return;
    }

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        }
        else if (arg == "--check") {
            setAction(Action::CHECK, arg);
        }
        else if (arg == "--format") {
            setAction(Action::FORMAT, arg);
        }
        else if (arg == "--json") {
            setAction(Action::JSON, arg);
        }
        else if (arg == "--indent") {
            encodeOptions_.indent = parse_indent(value_of(i, arg));
        }
        else if (arg == "--separator") {
            encodeOptions_.separator = value_of(i, arg);
        }
        else if (arg == "--array-separator") {
            encodeOptions_.array_separator = value_of(i, arg);
        }
        else if (arg == "--trailing-newline") {
            encodeOptions_.trailing_newline = true;
        }
        else if (arg == "--output" || arg == "-o") {
            outputPath_ = value_of(i, arg);
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(cli_utils::unknown_argument_message(arg, valid_options));
        }
        else if (filePath_.empty()) {
            filePath_ = arg;
        }
        else {
            throw std::invalid_argument("unexpected argument: " + arg);
        }
    }

    if (filePath_.empty()) throw std::invalid_argument("missing input file");
    if (hasOutputPath() && action_ != Action::FORMAT && action_ != Action::JSON) {
        throw std::invalid_argument("--output only applies to --format and --json");
    }
}

void CliArgs::setAction(Action action, const std::string& flag) {
    if (actionSet_ && action != action_) {
        throw std::invalid_argument(actionFlag_ + " and " + flag + " cannot be combined");
    }
    action_ = action;
    actionSet_ = true;
    actionFlag_ = flag;
}

}  // namespace bru
