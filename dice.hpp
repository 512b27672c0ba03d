/**
 * @file dice.hpp
 * @brief A roll of two dice and the ledger of values still usable this turn.
 */

#ifndef BGE_DICE_HPP
#define BGE_DICE_HPP

#include <string>
#include <vector>
#include <utility>

#include "errors.hpp"

namespace BGE {

/**
 * @class Dice
 * @brief Availability ledger for one turn's pips.
 *
 * A roll (a,b) yields the usable values {a,b}; doubles (a,a) yield {a,a,a,a}.
 * Values are removed with consume() as hops are played. The ledger knows
 * nothing about legality.
 */
class Dice
{
public:
    /// An empty ledger (no roll yet).
    Dice() = default;

    /**
     * @brief Build the ledger for a roll.
     * @throws std::invalid_argument on faces outside 1..6.
     */
    Dice(int d1, int d2);

    /// Faces as rolled (doubles are not expanded here).
    std::pair<int,int> faces() const { return {_d1, _d2}; }

    bool doubles() const { return _d1!=0 && _d1==_d2; }

    /// Remaining pip values (one element per still-unused die).
    const std::vector<int>& remaining() const { return _left; }

    bool contains(int value) const;

    /**
     * @brief Remove one occurrence of @p value.
     * @throws InvalidDiceValue if @p value is not currently available.
     */
    void consume(int value);

    /// Highest remaining value, 0 when nothing is left.
    int max() const;

    bool empty() const { return _left.empty(); }
    std::size_t size() const { return _left.size(); }

    /// "d1-d2", or "-" before a roll.
    std::string to_string() const;

private:
    int _d1=0, _d2=0;
    std::vector<int> _left;
};

} // namespace BGE

#endif // BGE_DICE_HPP
