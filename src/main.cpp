#include "csvsed/application/csvsed_app.hpp"
#include "csvsed/io/shell_command_runner.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

auto print_usage(std::ostream& os) -> void {
    os << "Usage: csvsed [options] EXPRESSION [FILE]\n";
    os << "A stream-oriented CSV modification tool. Like a stripped-down \"sed\"\n";
    os << "command, but for tabular data.\n\n";
    os << "  -c, --columns LIST       Comma separated column indices (0-based) or names\n";
    os << "                           to modify; ranges like 2-4 are allowed (default: all)\n";
    os << "  -r, --expr EXPRESSION    Modifier to apply instead of the positional EXPRESSION\n";
    os << "  -d, --delimiter CHAR     Input field delimiter (default: ,)\n";
    os << "  -t, --tabs               Input is tab-delimited\n";
    os << "  -q, --quotechar CHAR     Quote character (default: \")\n";
    os << "  -D, --out-delimiter CHAR Output field delimiter (default: ,)\n";
    os << "  -H, --no-header-row      Input has no header row\n";
    os << "      --timeout-ms N       Limit for each external command, 0 = none (default: 30000)\n";
    os << "  -h, --help               Show this help\n";
    os << "\nExpressions:\n";
    os << "  s/REGEX/REPL/FLAGS       Substitute; flags: i g l m s u x\n";
    os << "  y/SOURCE/DEST/FLAGS      Transliterate; ranges like a-z; flag: i\n";
    os << "  e/COMMAND/               Pipe the value through a shell command\n";
    os << "\nExamples:\n";
    os << "  csvsed -c name 's/^ +| +$//g' people.csv      # Trim a column\n";
    os << "  csvsed -c 0,2 'y/a-z/A-Z/' data.csv           # Upper-case two columns\n";
    os << "  csvsed -c price 'e/xargs printf %.2f/' < in.csv\n";
}

[[noreturn]] auto usage_error(const std::string& message) -> void {
    std::cerr << "Error: " << message << "\n\n";
    print_usage(std::cerr);
    std::exit(1);
}

auto parse_char(const std::string& option, const std::string& value) -> char {
    if (value == "\\t") {
        return '\t';
    }
    if (value.size() != 1) {
        usage_error(option + " expects a single character, got \"" + value + "\"");
    }
    return value[0];
}

auto parse_args(int argc, char* argv[]) -> csvsed::Config {
    csvsed::Config config;
    bool have_expression = false;
    bool have_input = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                usage_error("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            std::exit(0);
        } else if (arg == "-c" || arg == "--columns") {
            config.columns = value();
        } else if (arg == "-r" || arg == "--expr") {
            config.expression = value();
            have_expression = true;
        } else if (arg == "-d" || arg == "--delimiter") {
            config.input_dialect.delimiter = parse_char(arg, value());
        } else if (arg == "-t" || arg == "--tabs") {
            config.input_dialect.delimiter = '\t';
        } else if (arg == "-q" || arg == "--quotechar") {
            config.input_dialect.quote_char = parse_char(arg, value());
            config.output_dialect.quote_char = config.input_dialect.quote_char;
        } else if (arg == "-D" || arg == "--out-delimiter") {
            config.output_dialect.delimiter = parse_char(arg, value());
        } else if (arg == "-H" || arg == "--no-header-row") {
            config.has_header = false;
        } else if (arg == "--timeout-ms") {
            auto text = value();
            try {
                auto millis = std::stoll(text);
                if (millis < 0) {
                    usage_error("--timeout-ms must not be negative");
                }
                config.command_timeout = std::chrono::milliseconds(millis);
            } catch (const std::logic_error&) {
                usage_error("--timeout-ms expects a number, got \"" + text + "\"");
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            usage_error("Unknown option " + arg);
        } else if (!have_expression) {
            config.expression = arg;
            have_expression = true;
        } else if (!have_input) {
            config.input_file = arg;
            have_input = true;
        } else {
            usage_error("Unexpected argument " + arg);
        }
    }

    if (!have_expression || config.expression.empty()) {
        usage_error("Missing modifier expression");
    }

    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = parse_args(argc, argv);

    csvsed::CsvsedApp app(std::make_shared<csvsed::ShellCommandRunner>());
    return app.run(config);
}
