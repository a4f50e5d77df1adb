/**
 * @file cli.cpp
 * @brief emstr command line interface.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Renders integers, fixed-point values, hex and padded text through the
 * allocation-free encoders, one value per invocation.
 */

#include <emstr/emstr.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string_view>

using namespace emstr;

static constexpr const char* BANNER = "                                   \n"
                                      "  _____ __  __ ____ _____ ____    \n"
                                      " | ____|  \\/  / ___|_   _|  _ \\   \n"
                                      " |  _| | |\\/| \\___ \\ | | | |_) |  \n"
                                      " | |___| |  | |___) || | |  _ <   \n"
                                      " |_____|_|  |_|____/ |_| |_| \\_\\  \n"
                                      "                                   \n"
                                      "   by  T A N A G R A  S P A C E    \n";

/// Output buffer for a single rendered value
static constexpr std::size_t OUTPUT_BYTES = 1024;

static void print_version() {
    std::printf("emstr %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\n%s\n", BANNER);
    std::printf("Allocation-free string encoding (v%s C++)\n", version());
    std::printf("=========================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s int <value>\n", prog_name);
    std::printf("  %s frac <value> <divisor> [-t]\n", prog_name);
    std::printf("  %s hex <text>\n", prog_name);
    std::printf("  %s pad <left|right> <width> <fill> <text>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -t             Trim trailing zeros of the decimal part\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s int -1243566               # -1243566\n", prog_name);
    std::printf("  %s frac 1050 1000             # 1.050\n", prog_name);
    std::printf("  %s frac 1050 1000 -t          # 1.05\n", prog_name);
    std::printf("  %s hex abc                    # 616263\n", prog_name);
    std::printf("  %s pad left 6 0 42            # 000042\n\n", prog_name);
}

static bool parse_int(const char* text, long long& value) {
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

static int print_result(Error result, std::string_view text) {
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Encoding failed: %s (code %d)\n", error_string(result),
                     static_cast<int>(result));
        return 1;
    }
    std::printf("%.*s\n", static_cast<int>(text.size()), text.data());
    return 0;
}

static int do_int(const char* value_arg) {
    long long value = 0;
    if (!parse_int(value_arg, value)) {
        std::fprintf(stderr, "Error: Not an integer: %s\n", value_arg);
        return 1;
    }

    StrBuffer<MAX_INTEGER_LENGTH<long long>> buffer;
    auto result = buffer.append(value);
    return print_result(result, buffer.view());
}

static int do_frac(const char* value_arg, const char* divisor_arg, bool trim) {
    long long value = 0;
    long long divisor = 0;
    if (!parse_int(value_arg, value) || !parse_int(divisor_arg, divisor)) {
        std::fprintf(stderr, "Error: value and divisor must be integers\n");
        return 1;
    }
    if (divisor <= 0) {
        std::fprintf(stderr, "Error: divisor must be positive\n");
        return 1;
    }

    Fractional<long long> fractional(value, divisor, trim ? Trim::TrailingZeros : Trim::None);

    char buffer[OUTPUT_BYTES];
    std::string_view text;
    auto result = encode_str(fractional, buffer, sizeof(buffer), text);
    return print_result(result, text);
}

static int do_hex(const char* text_arg) {
    char buffer[OUTPUT_BYTES];
    std::string_view text;
    auto result = encode_str(Hex(std::string_view(text_arg)), buffer, sizeof(buffer), text);
    return print_result(result, text);
}

static int do_pad(const char* direction, const char* width_arg, const char* fill_arg,
                  const char* text_arg) {
    long long width = 0;
    if (!parse_int(width_arg, width) || width < 0) {
        std::fprintf(stderr, "Error: width must be a non-negative integer\n");
        return 1;
    }
    if (std::strlen(fill_arg) != 1) {
        std::fprintf(stderr, "Error: fill must be a single character\n");
        return 1;
    }

    char buffer[OUTPUT_BYTES];
    std::string_view text;
    Error result;
    if (std::strcmp(direction, "left") == 0) {
        result = concat(buffer, sizeof(buffer), text,
                        pad_left(text_arg, static_cast<std::size_t>(width), fill_arg[0]));
    } else if (std::strcmp(direction, "right") == 0) {
        result = concat(buffer, sizeof(buffer), text,
                        pad_right(text_arg, static_cast<std::size_t>(width), fill_arg[0]));
    } else {
        std::fprintf(stderr, "Error: direction must be 'left' or 'right'\n");
        return 1;
    }

    return print_result(result, text);
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "int") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Usage: %s int <value>\n", argv[0]);
            return 1;
        }
        return do_int(argv[2]);
    }

    if (std::strcmp(command, "frac") == 0) {
        bool trim = (argc == 5) && (std::strcmp(argv[4], "-t") == 0);
        if (argc != 4 && !trim) {
            std::fprintf(stderr, "Usage: %s frac <value> <divisor> [-t]\n", argv[0]);
            return 1;
        }
        return do_frac(argv[2], argv[3], trim);
    }

    if (std::strcmp(command, "hex") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Usage: %s hex <text>\n", argv[0]);
            return 1;
        }
        return do_hex(argv[2]);
    }

    if (std::strcmp(command, "pad") == 0) {
        if (argc != 6) {
            std::fprintf(stderr, "Usage: %s pad <left|right> <width> <fill> <text>\n", argv[0]);
            return 1;
        }
        return do_pad(argv[2], argv[3], argv[4], argv[5]);
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", command);
    std::fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
    return 1;
}
