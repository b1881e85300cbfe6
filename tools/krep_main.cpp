// =============================================================================
// krep_main.cpp - command-line entry point
// =============================================================================
//   krep [--data-dir DIR] [--config FILE] [--verbose] [now|rollup] [flags]
//
//   now     prescribe the next microdose and log it when done (default)
//   rollup  move the session WAL into the CSV archive
//
// Exit codes: 0 ok, 1 runtime error, 2 usage error.
// =============================================================================
#include "krep/app/MicrodoseService.hpp"
#include "krep/config/Config.hpp"
#include "krep/core/Error.hpp"
#include "krep/domain/Catalog.hpp"
#include "krep/infra/Log.hpp"
#include "krep/infra/WallClock.hpp"

#include <iostream>
#include <string>

using namespace krep;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct Options {
    std::string command = "now";
    std::string data_dir;
    std::string config_path;
    bool verbose = false;

    // now
    std::string category;
    bool dry_run = false;
    bool auto_complete = false;

    // rollup
    bool cleanup = false;
};

void usage(std::ostream& out) {
    out << "Usage: krep [--data-dir DIR] [--config FILE] [--verbose] [COMMAND]\n"
           "\n"
           "Commands:\n"
           "  now [--category vo2|gtg|mobility] [--dry-run] [--auto-complete]\n"
           "        prescribe the next microdose (default)\n"
           "  rollup [--cleanup]\n"
           "        archive logged sessions to sessions.csv\n";
}

// Global flags are accepted before or after the command.
bool parseArgs(int argc, char** argv, Options& opt, std::string& err) {
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                err = arg + " needs a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--data-dir") {
            if (!value(opt.data_dir)) return false;
        } else if (arg == "--config") {
            if (!value(opt.config_path)) return false;
        } else if (arg == "--verbose" || arg == "-v") {
            opt.verbose = true;
        } else if (arg == "--category") {
            if (!value(opt.category)) return false;
        } else if (arg == "--dry-run") {
            opt.dry_run = true;
        } else if (arg == "--auto-complete") {
            opt.auto_complete = true;
        } else if (arg == "--cleanup") {
            opt.cleanup = true;
        } else if (arg == "--help" || arg == "-h") {
            opt.command = "help";
            return true;
        } else if (!have_command && (arg == "now" || arg == "rollup")) {
            opt.command = arg;
            have_command = true;
        } else {
            err = "unexpected argument '" + arg + "'";
            return false;
        }
    }

    if (opt.command == "now" && opt.cleanup) {
        err = "--cleanup only applies to rollup";
        return false;
    }
    if (opt.command == "rollup" &&
        (!opt.category.empty() || opt.dry_run || opt.auto_complete)) {
        err = "--category, --dry-run and --auto-complete only apply to now";
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// now
// -----------------------------------------------------------------------------
enum class Action {
    DONE,
    SKIP,
    HARDER,
    QUIT
};

void display(const Catalog& catalog, const PrescribedMicrodose& p) {
    const auto& def = p.definition;
    std::cout << "\n=== " << def.name << " ===\n"
              << "Category: " << toString(def.category)
              << "   Duration: " << def.suggested_duration_seconds / 60 << " min ("
              << def.suggested_duration_seconds << "s)\n";

    for (const auto& block : def.blocks) {
        const auto* m = catalog.findMovement(block.movement_id);
        std::cout << "  - " << (m ? m->name : block.movement_id);
        if (&block == &def.blocks.front()) {
            if (p.reps) std::cout << ": " << *p.reps << " reps";
            if (p.style && p.style->kind != MovementStyle::Kind::NONE) {
                std::cout << " (" << describe(*p.style) << ")";
            }
        }
        std::cout << "\n";
    }

    if (def.reference_url) {
        std::cout << "Reference: " << *def.reference_url << "\n";
    } else if (!def.blocks.empty()) {
        const auto* m = catalog.findMovement(def.blocks.front().movement_id);
        if (m && m->reference_url) std::cout << "Reference: " << *m->reference_url << "\n";
    }
}

Action prompt() {
    for (;;) {
        std::cout << "\n[Enter] done  [s] skip  [h] harder next time  [q] quit: " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) return Action::QUIT;

        if (line.empty()) return Action::DONE;
        if (line == "s" || line == "S") return Action::SKIP;
        if (line == "h" || line == "H") return Action::HARDER;
        if (line == "q" || line == "Q") return Action::QUIT;
        std::cout << "Unknown choice '" << line << "'\n";
    }
}

int cmdNow(MicrodoseService& service, const Options& opt) {
    std::optional<MicrodoseCategory> target;
    if (!opt.category.empty()) {
        target = parseCategory(opt.category);
        if (!target) {
            KREP_LOG_WARN("KREP", "unknown category '" << opt.category
                          << "', using default selection");
        }
    }

    UserContext ctx = service.loadContext(infra::now());
    PrescribedMicrodose p = service.prescribe(ctx, target);

    for (;;) {
        display(service.catalog(), p);

        if (opt.dry_run) {
            std::cout << "\n[Dry run - not logging session]\n";
            return EXIT_OK;
        }

        const Action action = opt.auto_complete ? Action::DONE : prompt();
        switch (action) {
            case Action::DONE: {
                Session s = service.complete(p, infra::now());
                std::cout << "\nSession logged (" << toString(s.id) << ")\n";
                return EXIT_OK;
            }
            case Action::SKIP:
                p = service.skip(ctx, p, infra::now(), target);
                std::cout << "\nSkipped. Next up:\n";
                break;
            case Action::HARDER: {
                HarderResult r = service.harder(p, infra::now());
                if (!r.state) {
                    std::cout << "\n" << p.definition.id << " has no progression\n";
                } else if (!r.changed) {
                    std::cout << "\nAlready at the top: level " << r.state->level
                              << ", " << r.state->reps << " reps\n";
                } else {
                    std::cout << "\nIntensity increased for next time: level "
                              << r.state->level << ", " << r.state->reps << " reps";
                    if (r.state->style.kind != MovementStyle::Kind::NONE) {
                        std::cout << " (" << describe(r.state->style) << ")";
                    }
                    std::cout << "\n";
                }
                return EXIT_OK;
            }
            case Action::QUIT:
                return EXIT_OK;
        }
    }
}

// -----------------------------------------------------------------------------
// rollup
// -----------------------------------------------------------------------------
int cmdRollup(MicrodoseService& service, const Options& opt) {
    RollupReport r = service.rollup(opt.cleanup);
    if (r.archived == 0) {
        std::cout << "Nothing to roll up.\n";
    } else {
        std::cout << "Rolled up " << r.archived << " sessions\n"
                  << "  CSV: " << service.layout().archivePath() << "\n";
    }
    if (opt.cleanup) {
        std::cout << "Removed " << r.cleaned << " processed WAL files\n";
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char** argv) {
    Options opt;
    std::string err;
    if (!parseArgs(argc, argv, opt, err)) {
        std::cerr << "krep: " << err << "\n";
        usage(std::cerr);
        return EXIT_USAGE;
    }
    if (opt.command == "help") {
        usage(std::cout);
        return EXIT_OK;
    }
    if (opt.verbose) {
        krep::log::setLevel(krep::log::Level::DEBUG);
    }

    try {
        Config cfg = opt.config_path.empty() ? loadConfig() : loadConfig(opt.config_path);
        if (!opt.data_dir.empty()) {
            cfg.data_dir = opt.data_dir;
        }

        Catalog catalog = buildCatalog(cfg);
        MicrodoseService service(std::move(cfg), std::move(catalog));

        if (opt.command == "rollup") {
            return cmdRollup(service, opt);
        }
        return cmdNow(service, opt);
    } catch (const CatalogValidationError& e) {
        std::cerr << "[KREP] ERROR: catalog is inconsistent (" << e.problems().size()
                  << " problems)\n";
        return EXIT_ERROR;
    } catch (const Error& e) {
        std::cerr << "[KREP] ERROR: " << e.what()
                  << (e.retryable() ? " (try again)" : "") << "\n";
        return EXIT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "[KREP] ERROR: " << e.what() << "\n";
        return EXIT_ERROR;
    }
}
