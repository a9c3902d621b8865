/**
 * @file main.cpp
 * @brief matterwave entry: fixed-interval driver for the Simulation, with an ncurses view or headless output.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <algorithm>
#include <exception>
#include <string>
#include <vector>
#include "Logger.h"
#include "Patterns.h"
#include "SimConfig.h"
#include "Simulation.h"
#include "TerminalView.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Handle terminal suspension (Ctrl+Z): restore tty before stopping.
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{}; sa.sa_handler = SIG_DFL; sigemptyset(&sa.sa_mask); sa.sa_flags = 0; sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume after suspension: restore curses program mode and redraw UI
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    TerminalView::initColors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

static bool parseCount(const std::string& s, long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno != 0 || v < 0) return false;
    out = v;
    return true;
}

/** @brief Options handled by the driver itself (everything else is SimConfig). */
struct DriverOptions {
    long headless{-1};     /**< generations to run without a terminal; -1 = interactive */
    long report{10};       /**< headless: print a line every N generations */
    std::string pattern;   /**< seed a built-in pattern instead of randomizing */
    bool help{false};
};

static bool parseDriverOptions(const std::vector<std::string>& args, DriverOptions& out) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto valueOf = [&](const std::string& flag, std::string& v) -> bool {
            if (a == flag) {
                if (i + 1 >= args.size()) return false;
                v = args[++i];
                return true;
            }
            if (a.rfind(flag + "=", 0) == 0) { v = a.substr(flag.size() + 1); return true; }
            return false;
        };
        std::string v;
        if (a == "-h" || a == "--help") { out.help = true; continue; }
        if (valueOf("--headless", v)) {
            if (!parseCount(v, out.headless)) { Logger::error("bad --headless value: " + v); return false; }
        } else if (valueOf("--report", v)) {
            if (!parseCount(v, out.report) || out.report < 1) { Logger::error("bad --report value: " + v); return false; }
        } else if (valueOf("--pattern", v)) {
            if (!findPattern(v)) { Logger::error("unknown pattern: " + v); return false; }
            out.pattern = v;
        } else {
            Logger::warn("ignoring unknown argument: " + a);
        }
    }
    return true;
}

static void printUsage(const char* argv0) {
    std::printf("usage: %s [--headless N] [--report K] [--pattern NAME] [--option=value ...]\n", argv0);
    std::printf("patterns:");
    for (const auto& p : builtinPatterns()) std::printf(" %s", p.name.c_str());
    std::printf("\noptions (also MATTERWAVE_<OPTION> in the environment):\n ");
    for (const auto& n : configOptionNames()) std::printf(" --%s", n.c_str());
    std::printf("\n");
}

static void seedInitial(Simulation& sim, const DriverOptions& opts) {
    if (!opts.pattern.empty()) {
        sim.centerPattern(findPattern(opts.pattern)->lines, Population::Matter);
        Logger::info("seeded pattern " + opts.pattern);
    } else {
        sim.randomize();
    }
}

static int runHeadless(Simulation& sim, const DriverOptions& opts) {
    seedInitial(sim, opts);
    for (long g = 1; g <= opts.headless && !g_stop; ++g) {
        sim.step();
        if (g % opts.report == 0 || g == opts.headless) {
            auto s = sim.snapshot();
            std::printf("gen=%llu matter=%zu antimatter=%zu energy=%.4f mean=%+.5f nuclei=%llu annihilations=%llu dropped=%llu\n",
                        (unsigned long long)s->generation, s->matter.size(), s->antimatter.size(),
                        s->mediumEnergy, s->mediumMean, (unsigned long long)s->totalNuclei,
                        (unsigned long long)s->consumedAnnihilations, (unsigned long long)s->droppedAnnihilations);
            std::fflush(stdout);
        }
    }
    return 0;
}

static int runInteractive(SimConfig cfg, const DriverOptions& opts, bool rowsGiven, bool colsGiven) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // non-blocking getch
    timeout(0);
    TerminalView::initColors();

    int termRows, termCols;
    getmaxyx(stdscr, termRows, termCols);
    if (termRows - 1 < 1 || termCols < 1) {
        Logger::error("terminal too small");
        endwin();
        g_curses_inited = false;
        return 1;
    }
    // Grid follows the terminal unless given explicitly.
    if (!rowsGiven) cfg.rows = termRows - 1;
    if (!colsGiven) cfg.cols = termCols;

    Simulation sim(cfg);
    TerminalView view(stdscr);
    seedInitial(sim, opts);
    bool running = false; // start paused
    int speedMs = sim.config().speedMs;
    int curR = sim.config().rows / 2;
    int curC = sim.config().cols / 2;
    view.setCursor(curR, curC);
    view.draw(*sim.snapshot(), true);
    Logger::info("grid initialized: " + std::to_string(sim.config().rows) + "x" + std::to_string(sim.config().cols));

    using namespace std::chrono;
    auto lastStep = steady_clock::now();
    bool done = false;
    while (!done) {
        if (g_stop) done = true;

        if (running) {
            auto now = steady_clock::now();
            if (duration_cast<milliseconds>(now - lastStep).count() >= speedMs) {
                sim.step();
                lastStep = now;
            }
        } else {
            lastStep = steady_clock::now();
        }

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; break;
            case 's': case 'S':
                running = !running; Logger::info(std::string("running = ") + (running ? "true" : "false")); break;
            case 'p': case 'P':
                running = false; Logger::info("paused"); break;
            case 'n': case 'N':
                if (!running) sim.step();
                break;
            case 'r': case 'R':
                sim.randomize(); view.setStatusNote("randomized"); break;
            case 'c': case 'C':
                sim.clear(); view.setStatusNote("cleared"); break;
            case 'w': case 'W':
                sim.setTopology(!sim.config().wrap); break;
            case 'm': case 'M':
                sim.setMediumMode(sim.config().mediumMode == MediumMode::Off ? MediumMode::Nucleation : MediumMode::Off); break;
            case 'a': case 'A':
                sim.setAntimatterEnabled(!sim.config().antimatterEnabled); break;
            case '1': case '2': case '3': case '4': case '5': {
                size_t idx = (size_t)(ch - '1');
                const auto& pats = builtinPatterns();
                if (idx < pats.size()) {
                    sim.centerPattern(pats[idx].lines, Population::Matter);
                    view.setStatusNote("pattern " + pats[idx].name);
                }
                break; }
            case KEY_UP:    curR = std::max(0, curR - 1); view.setCursor(curR, curC); g_needs_full_redraw = 1; break;
            case KEY_DOWN:  curR = std::min(sim.config().rows - 1, curR + 1); view.setCursor(curR, curC); g_needs_full_redraw = 1; break;
            case KEY_LEFT:  curC = std::max(0, curC - 1); view.setCursor(curR, curC); g_needs_full_redraw = 1; break;
            case KEY_RIGHT: curC = std::min(sim.config().cols - 1, curC + 1); view.setCursor(curR, curC); g_needs_full_redraw = 1; break;
            case ' ':
                sim.paintCell(curR, curC, sim.automatonEngine().isAlive(curR, curC, Population::Matter) ? PaintMode::Erase : PaintMode::Add);
                break;
            case '+':
                speedMs = std::max(10, speedMs - 10); Logger::info("delay set(ms): " + std::to_string(speedMs)); break;
            case '-':
                speedMs = std::min(400, speedMs + 10); Logger::info("delay set(ms): " + std::to_string(speedMs)); break;
            default:
                break;
        }

        view.draw(*sim.snapshot(), g_needs_full_redraw != 0);
        g_needs_full_redraw = 0;
        view.drawStatusLine(*sim.snapshot(), running, speedMs);
        doupdate();

        std::this_thread::sleep_for(std::chrono::milliseconds(16)); // ~60 FPS UI
    }

    endwin();
    g_curses_inited = false;
    return 0;
}

/** @brief Program entry: reads configuration, then runs interactively or headless. */
int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "matterwave");
    Logger::info("matterwave starting");
    std::set_terminate([]{
        auto ep = std::current_exception();
        if (ep) {
            try { std::rethrow_exception(ep); }
            catch (const std::exception& e) { Logger::logException("std::terminate (matterwave)", e); }
            catch (...) { Logger::logUnknownException("std::terminate (matterwave)"); }
        } else {
            Logger::error("std::terminate (matterwave): no active exception");
        }
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    SimConfig cfg;
    AppliedOptions given;
    applyEnvOverrides(cfg, &given);
    std::vector<std::string> rest = applyArgOverrides(cfg, argc, argv, &given);
    DriverOptions opts;
    if (!parseDriverOptions(rest, opts)) {
        printUsage(argc > 0 ? argv[0] : "matterwave");
        Logger::shutdown();
        return 1;
    }
    if (opts.help) {
        printUsage(argc > 0 ? argv[0] : "matterwave");
        Logger::shutdown();
        return 0;
    }

    int rc = 0;
    if (opts.headless >= 0) {
        Simulation sim(cfg);
        rc = runHeadless(sim, opts);
    } else {
        rc = runInteractive(cfg, opts, given.count("rows") != 0, given.count("cols") != 0);
    }
    Logger::info("matterwave terminating");
    Logger::shutdown();
    return rc;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (matterwave)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (matterwave)");
        Logger::shutdown();
        return 2;
    }
}
