/**
 * @file errors.cpp
 * @brief Names for error codes.
 */

#include "errors.hpp"

namespace BGE {

const char* errorName(ErrorCode c) {
    switch (c) {
        case ErrorCode::NONE:                 return "NONE";
        case ErrorCode::MALFORMED_NOTATION:   return "MALFORMED_NOTATION";
        case ErrorCode::INVALID_POINT:        return "INVALID_POINT";
        case ErrorCode::INVALID_KEYWORD:      return "INVALID_KEYWORD";
        case ErrorCode::INVALID_DICE_VALUE:   return "INVALID_DICE_VALUE";
        case ErrorCode::MUST_ENTER_FROM_BAR:  return "MUST_ENTER_FROM_BAR";
        case ErrorCode::ILLEGAL_DISTANCE:     return "ILLEGAL_DISTANCE";
        case ErrorCode::BLOCKED_DESTINATION:  return "BLOCKED_DESTINATION";
        case ErrorCode::ILLEGAL_BEAR_OFF:     return "ILLEGAL_BEAR_OFF";
        case ErrorCode::INCOMPLETE_TURN:      return "INCOMPLETE_TURN";
        case ErrorCode::NO_CHECKER_AT_ORIGIN: return "NO_CHECKER_AT_ORIGIN";
        case ErrorCode::HIGHER_DIE_REQUIRED:  return "HIGHER_DIE_REQUIRED";
        case ErrorCode::WRONG_PHASE:          return "WRONG_PHASE";
        case ErrorCode::OUT_OF_TURN:          return "OUT_OF_TURN";
        case ErrorCode::GAME_OVER:            return "GAME_OVER";
    }
    return "UNKNOWN";
}

} // namespace BGE
