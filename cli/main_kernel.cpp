#include "kernel/Kernel.h"
#include "io/Snapshot.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <memory>
#include <cstdlib>
#include <stdexcept>

static void printHelp() {
    std::cerr << "Kernel Commands:\n"
              << "  step N             # advance N steps\n"
              << "  state              # print JSON summary (config, metrics, events)\n"
              << "  metrics            # print current metrics\n"
              << "  received           # print received aggression per alive agent\n"
              << "  events             # list expulsion and catharsis events\n"
              << "  run T log          # run T steps, log metrics every 'log' steps to metrics.csv\n"
              << "  history FILE       # write the recorded history as CSV\n"
              << "  reset [VARIANT S]  # reset with optional variant (LM|AC|RL|RA) and seed\n"
              << "  help               # show this message\n"
              << "  quit               # exit\n"
              << "\nOptions: --variant= --source= --spread= --alpha= --gamma= --threshold=<x|none>\n"
              << "         --steps= --seed= --agents=  (MIMESIS_VARIANT env var sets the variant)\n";
}

static void printMetrics(const Kernel& kernel) {
    auto m = kernel.computeMetrics();
    auto modal = kernel.modalAgreement();
    std::cout << std::fixed << std::setprecision(4)
              << "Generation: " << kernel.generation() << "\n"
              << "Active agents: " << m.activeAgents << "\n"
              << "Tension: " << m.tension << "\n"
              << "Gini: " << m.gini << "\n"
              << "Entropy: " << m.entropy << "\n"
              << "Max share: " << m.maxShare << "\n"
              << "Convergence ratio: " << m.convergenceRatio << "\n"
              << "Modal agreement: " << m.modalAgreement
              << " (" << m.eligibleAgents << " eligible";
    if (modal.target >= 0) {
        std::cout << ", target " << modal.target;
    }
    std::cout << ")\n"
              << "Mean desire: " << m.meanDesire << "\n"
              << "Desire concentration: " << m.desireConcentration << "\n";
    std::cout.flush();
}

// Parses --name=value flags into cfg; returns false on an unknown option
static bool parseFlag(const std::string& arg, KernelConfig& cfg) {
    auto value = [&](const std::string& prefix) { return arg.substr(prefix.size()); };

    if (arg.rfind("--variant=", 0) == 0) {
        applyVariant(cfg, value("--variant="));
    } else if (arg.rfind("--source=", 0) == 0) {
        cfg.source = parseSourceMode(value("--source="));
    } else if (arg.rfind("--spread=", 0) == 0) {
        cfg.spread = parseSpreadMode(value("--spread="));
    } else if (arg.rfind("--alpha=", 0) == 0) {
        cfg.alpha = std::stod(value("--alpha="));
    } else if (arg.rfind("--gamma=", 0) == 0) {
        cfg.salienceExponent = std::stod(value("--gamma="));
    } else if (arg.rfind("--threshold=", 0) == 0) {
        std::string v = value("--threshold=");
        if (v == "none") {
            cfg.expulsionThreshold.reset();
        } else {
            cfg.expulsionThreshold = std::stod(v);
        }
    } else if (arg.rfind("--steps=", 0) == 0) {
        cfg.steps = std::stoi(value("--steps="));
    } else if (arg.rfind("--seed=", 0) == 0) {
        cfg.seed = std::stoull(value("--seed="));
    } else if (arg.rfind("--agents=", 0) == 0) {
        cfg.population = static_cast<std::uint32_t>(std::stoul(value("--agents=")));
    } else {
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    KernelConfig cfg;

    const char* scriptArg = nullptr;
    try {
        if (const char* envVariant = std::getenv("MIMESIS_VARIANT")) {
            applyVariant(cfg, envVariant);
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() && arg[0] == '-') {
                if (!parseFlag(arg, cfg)) {
                    std::cerr << "Unknown option: " << arg << "\n";
                    return 1;
                }
            } else {
                scriptArg = argv[i];
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<Kernel> kernel;
    try {
        kernel = std::make_unique<Kernel>(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Kernel: " << cfg.population << " agents, source=" << toString(cfg.source)
              << ", spread=" << toString(cfg.spread) << ", seed=" << cfg.seed << "\n";

    // Check if there's a script file argument
    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        // Interactive mode
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }

        if (cmd == "step") {
            int n = 1;
            iss >> n;
            if (n < 1) n = 1;
            for (int i = 0; i < n; ++i) {
                kernel->step();
                if ((i + 1) % 100 == 0 || i == n - 1) {
                    std::cerr << "Tick " << (i + 1) << "/" << n << "\r";
                    std::cerr.flush();
                }
            }
            std::cerr << "\n";
            std::cout << historyToJson(*kernel) << "\n";
            std::cout.flush();

        } else if (cmd == "state") {
            std::cout << historyToJson(*kernel) << "\n";
            std::cout.flush();

        } else if (cmd == "metrics") {
            printMetrics(*kernel);

        } else if (cmd == "received") {
            auto received = kernel->receivedAggression();
            std::cout << std::fixed << std::setprecision(4);
            for (std::size_t i = 0; i < received.ids.size(); ++i) {
                std::cout << received.ids[i] << " " << received.amounts[i] << "\n";
            }
            std::cout << "Total: " << received.total() << "\n";
            std::cout.flush();

        } else if (cmd == "events") {
            const auto& log = kernel->eventLog();
            if (log.empty()) {
                std::cout << "No expulsions.\n";
            }
            std::cout << std::fixed << std::setprecision(4);
            for (const auto& e : log.expulsions()) {
                std::cout << "Step " << e.step << ": expelled agent " << e.victim
                          << " (received " << e.received << ")\n";
            }
            for (const auto& c : log.catharsis()) {
                std::cout << "Step " << c.step << ": catharsis after agent " << c.victim
                          << " (tension drop " << std::setprecision(1) << c.drop * 100.0
                          << "%)\n" << std::setprecision(4);
            }
            std::cout.flush();

        } else if (cmd == "reset") {
            KernelConfig newCfg = cfg;
            std::string variant;
            if (iss >> variant) {
                std::uint64_t seed = newCfg.seed;
                if (iss >> seed) {
                    newCfg.seed = seed;
                }
                try {
                    applyVariant(newCfg, variant);
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Error: " << e.what() << "\n";
                    continue;
                }
            }

            kernel->reset(newCfg);
            cfg = newCfg;
            std::cout << "Reset: " << cfg.population << " agents (source=" << toString(cfg.source)
                      << ", spread=" << toString(cfg.spread) << ", seed=" << cfg.seed << ")\n";
            std::cout.flush();

        } else if (cmd == "run") {
            int ticks = cfg.steps;
            int log_freq = 10;
            iss >> ticks >> log_freq;
            if (log_freq < 1) log_freq = 1;

            bool isNewFile = !std::filesystem::exists("metrics.csv");
            std::ofstream metricsFile("metrics.csv", std::ios::app);
            if (!metricsFile) {
                std::cerr << "Error: Could not open metrics.csv\n";
                continue;
            }
            if (isNewFile) {
                logMetricsHeader(metricsFile);
            }

            for (int t = 0; t < ticks; ++t) {
                kernel->step();
                if ((t + 1) % 100 == 0 || t == ticks - 1) {
                    std::cerr << "Tick " << (t + 1) << "/" << ticks << "\r";
                    std::cerr.flush();
                }
                if (t % log_freq == 0 || t == ticks - 1) {
                    auto m = kernel->computeMetrics();
                    logMetrics(*kernel, metricsFile);

                    std::cout << "Tick " << (t + 1) << ": "
                              << "Active=" << m.activeAgents << ", "
                              << "Tension=" << std::fixed << std::setprecision(3) << m.tension << ", "
                              << "Gini=" << m.gini << ", "
                              << "Modal=" << m.modalAgreement << ", "
                              << "Expelled=" << kernel->eventLog().expulsions().size()
                              << "\n";
                    std::cout.flush();
                }
            }

            std::cerr << "\n";
            metricsFile.close();
            std::cout << "Completed " << ticks << " ticks. Metrics written to metrics.csv\n";
            std::cout.flush();

        } else if (cmd == "history") {
            std::string path;
            if (!(iss >> path)) {
                writeHistoryCsv(*kernel, std::cout);
                std::cout.flush();
                continue;
            }
            std::ofstream out(path);
            if (!out) {
                std::cerr << "Error: Could not open '" << path << "'\n";
                continue;
            }
            writeHistoryCsv(*kernel, out);
            std::cout << "History (" << kernel->history().size() << " steps) written to " << path << "\n";

        } else if (cmd == "quit") {
            break;

        } else if (cmd == "help") {
            printHelp();

        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
            printHelp();
        }
    }

    return 0;
}
