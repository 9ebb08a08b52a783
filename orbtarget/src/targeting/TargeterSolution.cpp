/**
 * @file TargeterSolution.cpp
 */

#include "orbtarget/targeting/TargeterSolution.hpp"
#include <iomanip>
#include <stdexcept>

namespace orbtarget::targeting {

double TargeterSolution::correction_for(Vary component) const {
    for (std::size_t i = 0; i < variables.size(); ++i) {
        if (variables[i].component == component) {
            return correction(static_cast<Eigen::Index>(i));
        }
    }
    throw std::out_of_range("No variable " + to_string(component) + " in this solution");
}

void TargeterSolution::print_summary(std::ostream& os) const {
    std::ios_base::fmtflags flags = os.flags();

    os << "\n=== Targeter Solution ===\n";
    os << "Converged in " << iterations << (iterations == 1 ? " iteration" : " iterations")
       << " (" << std::fixed << std::setprecision(3) << computation_time_s << " s)\n";
    if (correction_frame) {
        os << "Correction frame: " << coordinates::to_string(*correction_frame) << "\n";
    }

    os << "\nCorrections:\n";
    for (std::size_t i = 0; i < variables.size(); ++i) {
        os << "  " << std::left << std::setw(14) << to_string(variables[i].component) << std::right
           << std::scientific << std::setprecision(9) << std::setw(18)
           << correction(static_cast<Eigen::Index>(i)) << "\n";
    }

    os << "\nObjectives:\n";
    for (std::size_t i = 0; i < objectives.size(); ++i) {
        const auto idx = static_cast<Eigen::Index>(i);
        os << "  " << std::left << std::setw(16) << coordinates::to_string(objectives[i].parameter)
           << std::right << std::fixed << std::setprecision(6)
           << " achieved = " << std::setw(18) << achieved_values(idx)
           << "  desired = " << std::setw(18) << objectives[i].desired_value
           << "  error = " << std::scientific << std::setprecision(3) << achieved_errors(idx)
           << " (tol " << objectives[i].tolerance << ")\n";
    }

    if (maneuver) {
        os << "\n" << *maneuver << "\n";
    }
    os << "\nCorrected state: " << corrected_state.orbit << "\n";
    os << "Achieved state:  " << achieved_state.orbit << "\n";
    os << "=========================\n";

    os.flags(flags);
}

} // namespace orbtarget::targeting
