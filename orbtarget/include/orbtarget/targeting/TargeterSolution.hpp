/**
 * @file TargeterSolution.hpp
 * @brief Result of a converged targeting run
 */

#ifndef ORBTARGET_TARGETING_TARGETER_SOLUTION_HPP
#define ORBTARGET_TARGETING_TARGETER_SOLUTION_HPP

#include "orbtarget/dynamics/Maneuver.hpp"
#include "orbtarget/dynamics/Spacecraft.hpp"
#include "orbtarget/targeting/Objective.hpp"
#include "orbtarget/targeting/Variable.hpp"
#include <Eigen/Dense>
#include <iostream>
#include <optional>
#include <vector>

namespace orbtarget::targeting {

struct TargeterSolution {
    dynamics::Spacecraft corrected_state;                   ///< Initial state with the total correction applied
    dynamics::Spacecraft achieved_state;                    ///< Terminal state at the achievement epoch
    std::vector<Variable> variables;
    std::vector<Objective> objectives;
    Eigen::VectorXd correction;                             ///< Total correction, one entry per variable
    Eigen::VectorXd achieved_values;                        ///< Scaled achieved values, one per objective
    Eigen::VectorXd achieved_errors;                        ///< desired - achieved, one per objective
    int iterations = 0;                                     ///< Iterations used
    double computation_time_s = 0.0;                        ///< Wall time [s]
    std::optional<coordinates::LocalFrame> correction_frame;
    std::optional<dynamics::Maneuver> maneuver;             ///< Converged burn of a finite-burn target

    bool is_finite_burn() const { return maneuver.has_value(); }

    /**
     * @brief Total correction applied to a variable
     * @throws std::out_of_range if @p component is not a variable of this run
     */
    double correction_for(Vary component) const;

    void print_summary(std::ostream& os = std::cout) const;
};

} // namespace orbtarget::targeting

#endif // ORBTARGET_TARGETING_TARGETER_SOLUTION_HPP
