/**
 * @file config.hpp
 * @brief Front-end options for bgplay, from the command line and environment.
 */

#ifndef BGE_CONFIG_HPP
#define BGE_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

namespace BGE {

/**
 * @brief Options recognized by bgplay.
 *
 * An empty logPath means logging is off.
 */
struct Config {
    bool plain=false;               ///< line-mode REPL with the ASCII renderer
    bool help=false;                ///< print usage and exit
    std::optional<unsigned> seed;   ///< deterministic dice when set
    std::string logPath;
};

/**
 * @brief Parse arguments (without the program name).
 * @param envLog value of BGE_LOG, or null; used only when --log is absent.
 * @throws std::invalid_argument on unknown options or malformed values.
 */
Config parseConfig(const std::vector<std::string>& args, const char* envLog);

/// Convenience overload reading argv and the BGE_LOG environment variable.
Config parseConfig(int argc, char** argv);

/// Usage text for --help and argument errors.
std::string usage(const std::string& prog);

} // namespace BGE

#endif // BGE_CONFIG_HPP
