//
// Class SimulationParameters
//   The run configuration of the slice solver: transverse grid, longitudinal
//   step, field solver and plasma lattice settings. Built from a
//   ParameterList, whose missing keys fall back to the defaults of the
//   reference example run.
//
#ifndef QSW_SIMULATION_PARAMETERS_H
#define QSW_SIMULATION_PARAMETERS_H

#include "Utility/ParameterList.h"

namespace qsw {

    struct SimulationParameters {
        // transverse grid: number of nodes per axis (odd) and their spacing
        int gridSteps;
        double gridStepSize;

        // longitudinal step and number of slices of a run
        double xiStepSize;
        int xiSteps;

        // weight s of the Helmholtz term of the mixed-boundary solver
        double subtractionTrick;

        // distance (in cells) between the grid edge and the reflecting wall
        int reflectPaddingSteps;
        // distance (in cells) between the grid edge and the plasma
        int plasmaPaddingSteps;
        // spacing of the coarse particles in cells
        int plasmaCoarseness;
        // number of virtual particles per cell and axis
        int plasmaFineness;

        // optional residual check of the mixed-boundary solves
        bool checkResidual;
        double residualTolerance;

        // print diagnostics every n slices
        int diagnosticsEachNSteps;

        /*!
         * The default parameter set
         */
        static ParameterList defaults();

        /*!
         * Builds the parameters from a list; keys that are not contained
         * take their default value
         * @param params user supplied parameters
         */
        static SimulationParameters fromParameterList(const ParameterList& params);

        /*!
         * Converts back into a parameter list (e.g. for printing)
         */
        ParameterList toParameterList() const;

        /*!
         * Number of grid cells covered by plasma on each axis
         */
        int plasmaSteps() const { return gridSteps - 2 * plasmaPaddingSteps; }

        /*!
         * Checks the configuration invariants; throws QswException on
         * the first violation
         */
        void validate() const;
    };
}  // namespace qsw

#endif
