#include "options.hpp"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace cli {

namespace {

// long-only options
enum : int {
    OPT_TPS = 1000,
    OPT_SEED,
};

long long parse_integer(const char *name, const char *text, long long min,
                        long long max) {
    errno = 0;
    char *end = nullptr;
    const long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || value < min ||
        value > max) {
        throw celleste::ConfigError(
            fmt::format("--{}: expected an integer in [{}, {}], got '{}'",
                        name, min, max, text));
    }
    return value;
}

std::uint64_t parse_seed(const char *text) {
    errno = 0;
    char *end = nullptr;
    const unsigned long long value = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || text[0] == '-') {
        throw celleste::ConfigError(
            fmt::format("--seed: expected an unsigned integer, got '{}'",
                        text));
    }
    return value;
}

double parse_density(const char *text) {
    errno = 0;
    char *end = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE) {
        throw celleste::ConfigError(
            fmt::format("--density: expected a number, got '{}'", text));
    }
    return value;
}

// name of the option getopt_long just rejected
std::string option_name(char **argv) {
    if (optopt != 0 && optopt < OPT_TPS) {
        return fmt::format("-{}", char(optopt));
    }
    return argv[optind - 1];
}

} // namespace

std::string usage(const char *prog) {
    return fmt::format(
        "Usage: {} [options] [RULE]\n"
        "\n"
        "Life-like cellular automaton. RULE uses B/S notation, e.g. B36/S23.\n"
        "\n"
        "Options:\n"
        "  -r, --rules RULE       rule to run (default {})\n"
        "  -s, --save-file PATH   file used by save and load (default {})\n"
        "  -l, --load-file PATH   load a save file at startup\n"
        "  -W, --width N          grid width in cells (default {})\n"
        "  -H, --height N         grid height in cells (default {})\n"
        "  -w, --wrap             wrap neighbors around the edges\n"
        "  -p, --paused           start paused\n"
        "  -t, --threads N        step threads, 0 or -1 = auto (default 1)\n"
        "      --tps N            generations per second, 0 = one per frame\n"
        "  -d, --density F        start from a random fill of density F\n"
        "      --seed N           seed for the random fill\n"
        "  -h, --help             show this text\n",
        prog, RuleSet::DEFAULT_RULE, DEFAULT_SAVE_FILE, EngineConfig{}.width,
        EngineConfig{}.height);
}

AppOptions parse_options(int argc, char **argv) {
    AppOptions opt;
    bool rules_given = false;

    const char *short_opts = ":r:s:l:W:H:wpt:d:h";
    const option long_opts[] = {
        {"rules", required_argument, nullptr, 'r'},
        {"save-file", required_argument, nullptr, 's'},
        {"load-file", required_argument, nullptr, 'l'},
        {"width", required_argument, nullptr, 'W'},
        {"height", required_argument, nullptr, 'H'},
        {"wrap", no_argument, nullptr, 'w'},
        {"paused", no_argument, nullptr, 'p'},
        {"threads", required_argument, nullptr, 't'},
        {"tps", required_argument, nullptr, OPT_TPS},
        {"density", required_argument, nullptr, 'd'},
        {"seed", required_argument, nullptr, OPT_SEED},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    // 0 makes glibc reinitialize its scan state, so parse_options can run
    // more than once per process
    optind = 0;
    opterr = 0;

    constexpr long long max_side = EngineConfig::MAX_DIMENSION;
    constexpr long long max_int = std::numeric_limits<int>::max();

    int c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts, nullptr)) !=
           -1) {
        switch (c) {
        case 'r':
            opt.rules = optarg;
            rules_given = true;
            break;
        case 's':
            opt.save_file = optarg;
            break;
        case 'l':
            opt.load_file = optarg;
            break;
        case 'W':
            opt.engine.width =
                std::uint32_t(parse_integer("width", optarg, 1, max_side));
            break;
        case 'H':
            opt.engine.height =
                std::uint32_t(parse_integer("height", optarg, 1, max_side));
            break;
        case 'w':
            opt.engine.edge = EdgePolicy::Wrap;
            break;
        case 'p':
            opt.engine.start_running = false;
            break;
        case 't':
            opt.engine.step_threads =
                int(parse_integer("threads", optarg, -1, 1024));
            break;
        case OPT_TPS:
            opt.engine.target_tps = int(parse_integer("tps", optarg, 0, max_int));
            break;
        case 'd':
            opt.engine.random_density = parse_density(optarg);
            break;
        case OPT_SEED:
            opt.engine.random_seed = parse_seed(optarg);
            break;
        case 'h':
            opt.show_help = true;
            break;
        case ':':
            throw celleste::ConfigError(
                fmt::format("Option '{}' requires a value", option_name(argv)));
        default:
            throw celleste::ConfigError(
                fmt::format("Unknown option '{}'", option_name(argv)));
        }
    }

    if (optind < argc) {
        if (rules_given) {
            throw celleste::ConfigError(fmt::format(
                "Rule given twice: --rules {} and '{}'", opt.rules,
                argv[optind]));
        }
        opt.rules = argv[optind++];
    }
    if (optind < argc) {
        throw celleste::ConfigError(
            fmt::format("Unexpected argument '{}'", argv[optind]));
    }

    validate_config(opt.engine);

    LOG_DEBUG("Options: rule {}, {}x{}, save file {}", opt.rules,
              opt.engine.width, opt.engine.height, opt.save_file);
    return opt;
}

} // namespace cli
