/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the parser, dice ledger, legality engine and game.
 */

#ifndef BGE_ERRORS_HPP
#define BGE_ERRORS_HPP

#include <string>
#include <utility>
#include <stdexcept>

namespace BGE {

/**
 * @enum ErrorCode
 * @brief Machine-friendly reason for a rejected input.
 *
 * Groups:
 * - parse   : MALFORMED_NOTATION, INVALID_POINT, INVALID_KEYWORD
 * - dice    : INVALID_DICE_VALUE
 * - legality: MUST_ENTER_FROM_BAR .. HIGHER_DIE_REQUIRED
 * - state   : WRONG_PHASE, OUT_OF_TURN, GAME_OVER
 */
enum class ErrorCode {
    NONE = 0,

    MALFORMED_NOTATION,
    INVALID_POINT,
    INVALID_KEYWORD,

    INVALID_DICE_VALUE,

    MUST_ENTER_FROM_BAR,
    ILLEGAL_DISTANCE,
    BLOCKED_DESTINATION,
    ILLEGAL_BEAR_OFF,
    INCOMPLETE_TURN,
    NO_CHECKER_AT_ORIGIN,
    HIGHER_DIE_REQUIRED,

    WRONG_PHASE,
    OUT_OF_TURN,
    GAME_OVER
};

/// Stable upper-case name of an error code (e.g. "BLOCKED_DESTINATION").
const char* errorName(ErrorCode c);

/**
 * @brief Thrown by the notation parser on text it cannot turn into moves.
 *
 * code() is one of MALFORMED_NOTATION, INVALID_POINT or INVALID_KEYWORD;
 * token() is the offending stop or group.
 */
class NotationError : public std::invalid_argument {
public:
    NotationError(ErrorCode code, std::string token, const std::string& what)
        : std::invalid_argument(what), _code(code), _token(std::move(token)) {}

    ErrorCode code() const { return _code; }
    const std::string& token() const { return _token; }

private:
    ErrorCode _code;
    std::string _token;
};

/// Thrown by Dice::consume() when the requested value is not available.
class InvalidDiceValue : public std::invalid_argument {
public:
    explicit InvalidDiceValue(int value)
        : std::invalid_argument("dice value " + std::to_string(value) + " is not available"),
          _value(value) {}

    ErrorCode code() const { return ErrorCode::INVALID_DICE_VALUE; }
    int value() const { return _value; }

private:
    int _value;
};

} // namespace BGE

#endif // BGE_ERRORS_HPP
