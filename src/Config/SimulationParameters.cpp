//
// Class SimulationParameters
//   The run configuration of the slice solver.
//
#include "Config/SimulationParameters.h"

#include <string>

#include "Utility/QswException.h"

namespace qsw {

    ParameterList SimulationParameters::defaults() {
        ParameterList p;
        p.add("grid_steps", 641);
        p.add("grid_step_size", 0.025);
        p.add("xi_step_size", 0.005);
        p.add("xi_steps", 600000);
        p.add("field_solver_subtraction_trick", 1.0);
        p.add("reflect_padding_steps", 5);
        p.add("plasma_padding_steps", 10);
        p.add("plasma_coarseness", 3);
        p.add("plasma_fineness", 2);
        p.add("check_residual", false);
        p.add("residual_tolerance", 1.0e-6);
        p.add("diagnostics_each_n_steps", 200);
        return p;
    }

    SimulationParameters SimulationParameters::fromParameterList(const ParameterList& params) {
        ParameterList p = defaults();
        p.merge(params);

        SimulationParameters sp;
        sp.gridSteps             = p.get<int>("grid_steps");
        sp.gridStepSize          = p.get<double>("grid_step_size");
        sp.xiStepSize            = p.get<double>("xi_step_size");
        sp.xiSteps               = p.get<int>("xi_steps");
        sp.subtractionTrick      = p.get<double>("field_solver_subtraction_trick");
        sp.reflectPaddingSteps   = p.get<int>("reflect_padding_steps");
        sp.plasmaPaddingSteps    = p.get<int>("plasma_padding_steps");
        sp.plasmaCoarseness      = p.get<int>("plasma_coarseness");
        sp.plasmaFineness        = p.get<int>("plasma_fineness");
        sp.checkResidual         = p.get<bool>("check_residual");
        sp.residualTolerance     = p.get<double>("residual_tolerance");
        sp.diagnosticsEachNSteps = p.get<int>("diagnostics_each_n_steps");
        return sp;
    }

    ParameterList SimulationParameters::toParameterList() const {
        ParameterList p;
        p.add("grid_steps", gridSteps);
        p.add("grid_step_size", gridStepSize);
        p.add("xi_step_size", xiStepSize);
        p.add("xi_steps", xiSteps);
        p.add("field_solver_subtraction_trick", subtractionTrick);
        p.add("reflect_padding_steps", reflectPaddingSteps);
        p.add("plasma_padding_steps", plasmaPaddingSteps);
        p.add("plasma_coarseness", plasmaCoarseness);
        p.add("plasma_fineness", plasmaFineness);
        p.add("check_residual", checkResidual);
        p.add("residual_tolerance", residualTolerance);
        p.add("diagnostics_each_n_steps", diagnosticsEachNSteps);
        return p;
    }

    void SimulationParameters::validate() const {
        const std::string where = "SimulationParameters::validate()";

        if (gridSteps < 5) {
            throw QswException(where, "grid_steps must be at least 5, got "
                                          + std::to_string(gridSteps) + ".");
        }
        if (gridSteps % 2 != 1) {
            throw QswException(where, "grid_steps must be odd, got "
                                          + std::to_string(gridSteps) + ".");
        }
        if (!(gridStepSize > 0) || !(xiStepSize > 0)) {
            throw QswException(where, "grid_step_size and xi_step_size must be positive.");
        }
        if (xiSteps < 0) {
            throw QswException(where, "xi_steps must not be negative.");
        }
        if (subtractionTrick < 0) {
            throw QswException(where, "field_solver_subtraction_trick must not be negative.");
        }
        if (plasmaCoarseness < 1 || plasmaFineness < 1) {
            throw QswException(where, "plasma_coarseness and plasma_fineness must be >= 1.");
        }
        if (reflectPaddingSteps <= plasmaCoarseness + 1) {
            throw QswException(where, "reflect_padding_steps ("
                                          + std::to_string(reflectPaddingSteps)
                                          + ") must exceed plasma_coarseness + 1 ("
                                          + std::to_string(plasmaCoarseness + 1) + ").");
        }
        if (2 * reflectPaddingSteps >= gridSteps) {
            throw QswException(where, "reflect_padding_steps leaves no room between the walls.");
        }
        // particles must start between the reflecting walls
        if (plasmaPaddingSteps < reflectPaddingSteps) {
            throw QswException(where, "plasma_padding_steps must be >= reflect_padding_steps.");
        }
        // the coarse lattice needs at least one particle on each side of the axis
        if (plasmaSteps() / (2 * plasmaCoarseness) < 2) {
            throw QswException(where, "plasma_padding_steps and plasma_coarseness leave an "
                                      "empty plasma lattice.");
        }
        if (checkResidual && !(residualTolerance > 0)) {
            throw QswException(where, "residual_tolerance must be positive.");
        }
        if (diagnosticsEachNSteps < 1) {
            throw QswException(where, "diagnostics_each_n_steps must be >= 1.");
        }
    }
}  // namespace qsw
