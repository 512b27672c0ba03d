/**
 * @file notation.cpp
 * @brief Notation parser and formatter.
 */

#include "notation.hpp"
#include <sstream>
#include <cctype>
#include <algorithm>

namespace BGE {

namespace {

enum class StopKind { POINT, BAR, OFF };
struct Stop { StopKind kind; int point; };

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::vector<std::string> splitws(const std::string& s){
    std::istringstream is(s); std::vector<std::string> out; std::string t; while(is>>t) out.push_back(t); return out;
}

// keeps empty pieces so "8//3" and "8/" are caught
std::vector<std::string> splitSlash(const std::string& s){
    std::vector<std::string> out;
    std::string::size_type a=0;
    while (true) {
        auto b = s.find('/', a);
        if (b==std::string::npos) { out.push_back(s.substr(a)); break; }
        out.push_back(s.substr(a, b-a));
        a = b+1;
    }
    return out;
}

std::string lower(std::string s){ for(char& c: s) c=(char)std::tolower((unsigned char)c); return s; }

bool allDigits(const std::string& s){
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c){ return std::isdigit((unsigned char)c)!=0; });
}

bool allAlpha(const std::string& s){
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c){ return std::isalpha((unsigned char)c)!=0; });
}

Stop parseStop(const std::string& tok, std::size_t pos, std::size_t last, const std::string& group){
    if (tok.empty())
        throw NotationError(ErrorCode::MALFORMED_NOTATION, group, "empty stop in '" + group + "'");

    if (allDigits(tok)) {
        auto nz = tok.find_first_not_of('0');
        std::string digits = nz==std::string::npos ? "0" : tok.substr(nz);
        int v = digits.size()>2 ? 0 : std::stoi(digits);
        if (v<1 || v>24)
            throw NotationError(ErrorCode::INVALID_POINT, tok, "point '" + tok + "' is not 1..24");
        return {StopKind::POINT, v};
    }

    if (allAlpha(tok)) {
        std::string w = lower(tok);
        if (w=="bar") {
            if (pos!=0) throw NotationError(ErrorCode::INVALID_KEYWORD, tok, "'bar' can only start a move");
            return {StopKind::BAR, BAR_STOP};
        }
        if (w=="off") {
            if (pos!=last) throw NotationError(ErrorCode::INVALID_KEYWORD, tok, "'off' can only end a move");
            return {StopKind::OFF, OFF_STOP};
        }
        if (pos==0 || pos==last)
            throw NotationError(ErrorCode::INVALID_KEYWORD, tok, "unknown keyword '" + tok + "'");
    }

    throw NotationError(ErrorCode::MALFORMED_NOTATION, tok, "cannot read '" + tok + "' in '" + group + "'");
}

} // namespace

int MoveRequest::origin() const {
    return std::visit(overloaded{
        [](const Enter&)     { return BAR_STOP; },
        [](const Normal& n)  { return n.from; },
        [](const BearOff& b) { return b.from; }
    }, kind);
}

int MoveRequest::destination() const {
    return std::visit(overloaded{
        [](const Enter& e)   { return e.to; },
        [](const Normal& n)  { return n.to; },
        [](const BearOff&)   { return OFF_STOP; }
    }, kind);
}

std::vector<MoveRequest> parse(const std::string& text) {
    std::vector<MoveRequest> out;
    unsigned group = 0;

    for (const std::string& g : splitws(text)) {
        std::vector<std::string> toks = splitSlash(g);
        if (toks.size()<2)
            throw NotationError(ErrorCode::MALFORMED_NOTATION, g, "move '" + g + "' needs at least two stops");

        std::vector<Stop> stops;
        for (std::size_t i=0; i<toks.size(); ++i)
            stops.push_back(parseStop(toks[i], i, toks.size()-1, g));

        for (std::size_t i=0; i+1<stops.size(); ++i) {
            const Stop &a = stops[i], &b = stops[i+1];
            MoveRequest m;
            m.group = group;
            if (a.kind==StopKind::BAR && b.kind==StopKind::OFF)
                throw NotationError(ErrorCode::MALFORMED_NOTATION, g, "cannot move from the bar straight off");
            if (a.kind==StopKind::BAR)      m.kind = Enter{b.point};
            else if (b.kind==StopKind::OFF) m.kind = BearOff{a.point};
            else                            m.kind = Normal{a.point, b.point};
            out.push_back(m);
        }
        ++group;
    }
    return out;
}

std::string format(const MoveRequest& m) {
    auto stop = [](int p, bool origin) -> std::string {
        if (origin && p==BAR_STOP) return "bar";
        if (!origin && p==OFF_STOP) return "off";
        return std::to_string(p);
    };
    return stop(m.origin(), true) + "/" + stop(m.destination(), false);
}

std::string format(const std::vector<MoveRequest>& ms) {
    std::string s;
    for (std::size_t i=0; i<ms.size(); ++i) {
        if (i) s += ' ';
        s += format(ms[i]);
    }
    return s;
}

} // namespace BGE
