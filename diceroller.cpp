#include "diceroller.hpp"

namespace BGE {

DiceRoller::DiceRoller() : _rng(std::random_device{}()) {}

DiceRoller::DiceRoller(unsigned seed) : _rng(seed) {}

int DiceRoller::die() {
    return _dist(_rng);
}

std::pair<int,int> DiceRoller::roll() {
    int a = die();
    int b = die();
    return {a, b};
}

} // namespace BGE
