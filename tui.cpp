/**
 * @file tui.cpp
 * @brief bgplay: interactive REPL over BGE::Game, in ncurses or plain line mode.
 *
 * Commands:
 *   open | open set W B | roll | set D1 D2 | <notation> | hint | state | new | help | quit
 *   An empty line submits an empty turn.
 *
 * Options: --plain --seed N --log PATH --help   (env BGE_LOG = --log)
 */

#include <locale.h>
#include <ncurses.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <sstream>
#include <cctype>
#include <stdexcept>

#include "board.hpp"
#include "game.hpp"
#include "config.hpp"
#include "diceroller.hpp"
#include "logger.hpp"
#include "boardrenderer.hpp"
#include "ncurses_renderer.hpp"

using std::string;
using std::vector;

static string trim(const string& s){
    auto a=s.find_first_not_of(" \t\r\n"); if (a==string::npos) return "";
    auto b=s.find_last_not_of(" \t\r\n");  return s.substr(a,b-a+1);
}
static vector<string> splitws(const string& s){
    std::istringstream is(s); vector<string> out; string t; while(is>>t) out.push_back(t); return out;
}
static string lower(string s){ for(char& c: s) c=(char)std::tolower((unsigned char)c); return s; }
static bool parseInt(const string& tok,int& out){
    try{ size_t idx=0; int v=std::stoi(tok,&idx); if(idx!=tok.size()) return false; out=v; return true; }
    catch(const std::invalid_argument&){ return false; }
    catch(const std::out_of_range&){ return false; }
}

static const char* kHelp =
    "open | open set W B | roll | set D1 D2 | <move e.g. 13/7 8/7> | hint | state | new | help | quit";

/**
 * @brief Front-end independent command handling.
 *
 * Each command yields one message line; the caller repaints afterwards.
 */
struct Session {
    BGE::Game& game;
    BGE::DiceRoller& roller;
    bool running=true;

    string afterDice(bool moving, const string& rolled){
        using namespace BGE;
        if (moving) return sideName(game.sideToMove()) + string(" rolled ") + rolled;
        return rolled + ": no legal move, turn passes to " + sideName(game.sideToMove());
    }

    string opening(int w, int b){
        using namespace BGE;
        const string rolled = "W=" + std::to_string(w) + " B=" + std::to_string(b);
        if (!game.setOpeningDice(w, b)) return "Opening " + rolled + " is doubles; roll again.";
        if (game.lastTurnForfeited())
            return "Opening " + rolled + ": no legal move, " + sideName(game.sideToMove()) + " to roll";
        return "Opening " + rolled + ", " + sideName(game.sideToMove()) + " moves first";
    }

    string move(const string& text){
        using namespace BGE;
        Side mover = game.sideToMove();
        if (!game.submitTurn(text))
            return string("Rejected (") + errorName(game.lastErrorCode()) + "): " + game.lastError();
        if (game.gameOver()) return string("*** ") + sideName(game.result().winner) + " wins ***";
        return string(sideName(mover)) + " played " + (text.empty() ? "-" : text);
    }

    string state(){
        using namespace BGE;
        const Board& b = game.board();
        return string("phase=") + phaseName(game.phase()) + " side=" + sideName(game.sideToMove()) +
               " dice=" + game.dice().to_string() +
               " bar W=" + std::to_string(b.countBar(WHITE)) + " B=" + std::to_string(b.countBar(BLACK)) +
               " off W=" + std::to_string(b.countOff(WHITE)) + " B=" + std::to_string(b.countOff(BLACK));
    }

    string handle(const string& raw){
        string line = trim(raw);
        if (line.empty()) return move("");

        auto toks = splitws(line);
        auto cmd = lower(toks[0]);

        // contract errors (wrong phase, bad dice) come back as exceptions
        try{
            if (cmd=="quit" || cmd=="exit"){
                running=false; return "bye";
            } else if (cmd=="help"){
                return kHelp;
            } else if (cmd=="new"){
                game.startGame();
                return "New game: opening roll.";
            } else if (cmd=="open"){
                if (toks.size()==1){
                    int w=roller.die(), b=roller.die();
                    return opening(w, b);
                }
                int w,b;
                if (toks.size()!=4 || lower(toks[1])!="set") return "Usage: open | open set W B";
                if (!parseInt(toks[2],w)||!parseInt(toks[3],b)) return "Dice must be 1..6";
                return opening(w, b);
            } else if (cmd=="roll"){
                auto d = roller.roll();
                bool moving = game.setDice(d.first, d.second);
                return afterDice(moving, std::to_string(d.first)+"-"+std::to_string(d.second));
            } else if (cmd=="set"){
                int d1,d2;
                if (toks.size()!=3) return "Usage: set D1 D2";
                if (!parseInt(toks[1],d1)||!parseInt(toks[2],d2)) return "Dice must be 1..6";
                bool moving = game.setDice(d1, d2);
                return afterDice(moving, std::to_string(d1)+"-"+std::to_string(d2));
            } else if (cmd=="hint"){
                if (game.phase()!=BGE::Phase::AwaitingMoves) return "No dice to play.";
                string out = "Legal hops:";
                for (const string& h : game.hints()) out += " " + h;
                return out;
            } else if (cmd=="state"){
                return state();
            }
        }catch(const std::exception& e){
            return string("Error: ")+e.what();
        }

        // anything else is move notation
        return move(line);
    }
};

// ---- ncurses front end -------------------------------------------------------

struct UI {
    WINDOW* boardw; // board drawing region
    int rows, cols;
    int board_h, board_w;
};

static void layout(UI& ui){
    getmaxyx(stdscr, ui.rows, ui.cols);
    ui.board_h = BGE::NcursesRenderer::kHeight;
    ui.board_w = BGE::NcursesRenderer::kWidth;
    int by = 1; // leave a top margin
    int bx = (ui.cols - ui.board_w)/2; if (bx<0) bx=0;

    if (ui.boardw){ delwin(ui.boardw); ui.boardw=nullptr; }
    ui.boardw = derwin(stdscr, ui.board_h, ui.board_w, by, bx);
}

static void draw_status(const BGE::Game& g){
    using namespace BGE;
    move(LINES-3, 0); clrtoeol();
    if (g.gameOver()){
        mvprintw(LINES-3, 0, "*** %s wins ***", sideName(g.result().winner));
        return;
    }
    mvprintw(LINES-3, 0, "phase=%s  side=%s  dice=%s",
             phaseName(g.phase()), sideName(g.sideToMove()), g.dice().to_string().c_str());
}

static void draw_msg(const std::string& m){
    move(LINES-2, 0); clrtoeol();
    attron(COLOR_PAIR(BGE::NcursesRenderer::CP_TEXT));
    mvprintw(LINES-2, 0, "%s", m.c_str());
    attroff(COLOR_PAIR(BGE::NcursesRenderer::CP_TEXT));
}

static string read_line(){
    move(LINES-1, 0); clrtoeol();
    printw("> ");
    echo(); curs_set(1);
    char buf[256]; wgetnstr(stdscr, buf, 255);
    noecho(); curs_set(0);
    return string(buf);
}

static int runCurses(Session& session){
    setlocale(LC_ALL, ""); // enable UTF-8
    initscr(); cbreak(); noecho(); keypad(stdscr, TRUE);
    curs_set(0);
    BGE::NcursesRenderer::initColors();

    UI ui{nullptr,0,0,0,0};
    layout(ui);
    BGE::NcursesRenderer renderer(ui.boardw);

    auto repaint = [&](){
        BGE::Game::Snapshot snap = session.game.snapshot();
        renderer.render(snap.board, snap.toMove);
        draw_status(session.game);
        mvprintw(0, 0, "bgplay: 'open' to start, Enter submits, 'help' lists commands");
        refresh();
    };

    repaint();
    while (session.running){
        string msg = session.handle(read_line());
        draw_msg(msg);
        repaint();
    }

    if (ui.boardw) delwin(ui.boardw);
    endwin();
    return 0;
}

// ---- plain line mode -----------------------------------------------------------

static int runPlain(Session& session){
    BGE::BoardRenderer renderer;
    auto repaint = [&](){
        renderer.render(session.game.snapshot());
        renderer.print(std::cout);
    };

    std::cout << "bgplay: 'open' to start, 'help' lists commands\n";
    repaint();
    string line;
    while (session.running){
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        std::cout << session.handle(line) << '\n';
        if (session.running) repaint();
    }
    return 0;
}

int main(int argc, char** argv){
    BGE::Config cfg;
    try{
        cfg = BGE::parseConfig(argc, argv);
    }catch(const std::invalid_argument& e){
        std::cerr << "bgplay: " << e.what() << '\n' << BGE::usage(argv[0]);
        return 2;
    }
    if (cfg.help){
        std::cout << BGE::usage(argv[0]);
        return 0;
    }

    std::unique_ptr<BGE::Logger> log;
    if (!cfg.logPath.empty()){
        log = std::make_unique<BGE::Logger>(cfg.logPath);
        if (!log->ok()) std::cerr << "bgplay: cannot open log " << cfg.logPath << ", logging disabled\n";
        else log->info(BGE::EventType::System, "", "bgplay started");
    }

    BGE::DiceRoller roller = cfg.seed ? BGE::DiceRoller(*cfg.seed) : BGE::DiceRoller();
    BGE::Game game(log.get());
    Session session{game, roller};

    return cfg.plain ? runPlain(session) : runCurses(session);
}
