/**
 * @file config.cpp
 * @brief Command-line and environment parsing for bgplay.
 */

#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace BGE {

static unsigned parseSeed(const std::string& tok) {
    if (tok.empty() || tok.find_first_not_of("0123456789")!=std::string::npos)
        throw std::invalid_argument("--seed expects a non-negative integer, got '"+tok+"'");
    try {
        unsigned long v = std::stoul(tok);
        if (v > 0xFFFFFFFFul) throw std::out_of_range(tok);
        return static_cast<unsigned>(v);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("--seed value out of range: "+tok);
    }
}

Config parseConfig(const std::vector<std::string>& args, const char* envLog) {
    Config c;
    bool logGiven=false;

    for (std::size_t i=0; i<args.size(); ++i) {
        const std::string& a = args[i];
        auto value = [&](const char* opt) -> const std::string& {
            if (i+1>=args.size()) throw std::invalid_argument(std::string(opt)+" requires a value");
            return args[++i];
        };

        if (a=="--plain") c.plain = true;
        else if (a=="--help" || a=="-h") c.help = true;
        else if (a=="--seed") c.seed = parseSeed(value("--seed"));
        else if (a=="--log") {
            c.logPath = value("--log");
            if (c.logPath.empty()) throw std::invalid_argument("--log requires a non-empty path");
            logGiven = true;
        }
        else throw std::invalid_argument("unknown argument '"+a+"'");
    }

    if (!logGiven && envLog && *envLog) c.logPath = envLog;
    return c;
}

Config parseConfig(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i=1; i<argc; ++i) args.emplace_back(argv[i]);
    return parseConfig(args, std::getenv("BGE_LOG"));
}

std::string usage(const std::string& prog) {
    return "usage: "+prog+" [--plain] [--seed N] [--log PATH] [--help]\n"
           "  --plain       line-mode REPL with the ASCII board\n"
           "  --seed N      deterministic dice\n"
           "  --log PATH    append game events to PATH (env BGE_LOG)\n";
}

} // namespace BGE
