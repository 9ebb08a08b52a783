/**
 * @file orbtarget_target.cpp
 * @brief Run a targeting scenario described in a JSON file
 *
 * Usage: orbtarget_target <scenario.json> [--quiet]
 *
 * Prints the solution summary and the JSON report. Exit codes:
 *   0  converged
 *   1  targeting or propagation failure
 *   2  bad command line or scenario file
 */

#include <orbtarget/Orbtarget.hpp>
#include <fstream>
#include <iostream>
#include <string>

using namespace orbtarget;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <scenario.json> [--quiet]\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string scenario_file;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--quiet" || arg == "-q") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (scenario_file.empty()) {
            scenario_file = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }
    if (scenario_file.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    config::TargetingScenario scenario;
    try {
        scenario = config::loadTargetingConfig(scenario_file);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Malformed scenario " << scenario_file << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Invalid scenario " << scenario_file << ": " << e.what() << "\n";
        return 2;
    }
    if (quiet) {
        scenario.settings.verbose = false;
    }

    if (!quiet) {
        std::cout << "orbtarget " << version() << "\n";
        std::cout << "Scenario: " << scenario_file << "\n";
        std::cout << "Initial state: " << scenario.spacecraft << "\n";
        std::cout << "Correction epoch:  " << scenario.correction_epoch << "\n";
        std::cout << "Achievement epoch: " << scenario.achievement_epoch << "\n";
    }

    targeting::TargeterSolution solution;
    try {
        solution = config::run_scenario(scenario);
    } catch (const targeting::TargetingError& e) {
        std::cerr << "Targeting failed: " << e.what() << "\n";
        return 1;
    } catch (const propagation::PropagationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid scenario: " << e.what() << "\n";
        return 2;
    }

    const nlohmann::json report = config::to_json(solution);
    if (!quiet) {
        solution.print_summary();
    }
    std::cout << report.dump(2) << std::endl;

    if (!scenario.output_file.empty()) {
        std::ofstream out(scenario.output_file);
        if (!out.is_open()) {
            std::cerr << "Could not write report to " << scenario.output_file << "\n";
            return 1;
        }
        out << report.dump(2) << "\n";
    }
    return 0;
}
