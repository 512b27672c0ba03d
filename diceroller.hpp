/**
 * @file diceroller.hpp
 * @brief Random dice for the front end. The engine itself never rolls.
 */

#ifndef BGE_DICEROLLER_HPP
#define BGE_DICEROLLER_HPP

#include <random>
#include <utility>

namespace BGE {

class DiceRoller
{
public:
    /// Seeded from std::random_device.
    DiceRoller();

    /// Deterministic sequence for @p seed.
    explicit DiceRoller(unsigned seed);

    /// One die, 1..6.
    int die();

    /// Two dice, 1..6 each.
    std::pair<int,int> roll();

private:
    std::mt19937 _rng;
    std::uniform_int_distribution<int> _dist{1, 6};
};

} // namespace BGE

#endif // BGE_DICEROLLER_HPP
