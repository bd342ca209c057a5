#include "RunOptions.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace cavern {

static const std::string& value_after(const std::vector<std::string>& args, size_t& i, const char* flag, const char* what) {
    if (i + 1 >= args.size()) {
        throw ConfigError(std::string("Error, ") + flag + " must be followed by " + what);
    }
    return args[++i];
}

static uint64_t parse_seed(const std::string& s) {
    errno = 0;
    char* end = nullptr;
    uint64_t v = 0;
    if (!s.empty() && s[0] == '-') {
        long long sv = std::strtoll(s.c_str(), &end, 10);
        v = static_cast<uint64_t>(sv);
    } else {
        v = std::strtoull(s.c_str(), &end, 10);
    }
    if (s.empty() || *end != '\0' || errno == ERANGE) {
        throw ConfigError("Error, -s must be followed by a numerical seed, got '" + s + "'");
    }
    return v;
}

static int parse_count(const std::string& s) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || errno == ERANGE || v < 1 || v > INT_MAX) {
        throw ConfigError("Error, -n must be followed by a positive count, got '" + s + "'");
    }
    return static_cast<int>(v);
}

RunOptions parseRunOptions(const std::vector<std::string>& args) {
    RunOptions o;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-s") {
            o.seed = parse_seed(value_after(args, i, "-s", "a seed"));
        } else if (a == "-n") {
            o.repeat = parse_count(value_after(args, i, "-n", "a count"));
        } else if (a == "-g") {
            o.display = true;
        } else if (a == "-l") {
            o.findCavernPath = value_after(args, i, "-l", "two cavern files");
            o.scramCavernPath = value_after(args, i, "-l", "two cavern files");
        } else if (a == "--no-timeout") {
            o.timeLimited = false;
        } else if (a == "-q") {
            o.quiet = true;
        } else if (a == "-h" || a == "--help") {
            o.help = true;
        } else {
            throw ConfigError("Error, unknown option '" + a + "'");
        }
    }
    return o;
}

std::string runUsage(const std::string& prog) {
    return "usage: " + prog + " [-s seed] [-n count] [-g] [-l find.cav scram.cav] [--no-timeout] [-q] [-h]\n"
           "  -s seed        seed for the caverns (0 = random)\n"
           "  -n count       number of games to play (default 1)\n"
           "  -g             show the display\n"
           "  -l f s         load the find and scram caverns from files\n"
           "  --no-timeout   run the solver in-process without time limits\n"
           "  -q             print errors only\n";
}

} // namespace cavern
