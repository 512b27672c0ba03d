/**
 * @file dice.cpp
 * @brief Dice ledger implementation.
 */

#include "dice.hpp"
#include <algorithm>
#include <stdexcept>

namespace BGE {

Dice::Dice(int d1, int d2) {
    if (d1<1||d1>6||d2<1||d2>6) throw std::invalid_argument("Dice: dice out of range");
    _d1=d1; _d2=d2;
    if (d1==d2) _left = {d1,d1,d1,d1};
    else        _left = {d1,d2};
}

bool Dice::contains(int value) const {
    return std::find(_left.begin(), _left.end(), value)!=_left.end();
}

void Dice::consume(int value) {
    auto it = std::find(_left.begin(), _left.end(), value);
    if (it==_left.end()) throw InvalidDiceValue(value);
    _left.erase(it);
}

int Dice::max() const {
    if (_left.empty()) return 0;
    return *std::max_element(_left.begin(), _left.end());
}

std::string Dice::to_string() const {
    if (_d1==0) return "-";
    return std::to_string(_d1) + "-" + std::to_string(_d2);
}

} // namespace BGE
