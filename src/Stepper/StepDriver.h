//
// Class StepDriver
//   Advances the plasma response from one xi slice to the next. A step is a
//   fixed predictor-corrector sequence:
//    1) drift the particles without fields (estimate)
//    2) push in the fields of the previous slice, deposit, solve the fields
//       with the previous fields in the screening term and average them with
//       the previous fields
//    3) push in the averaged fields from the previous particles, deposit,
//       solve with the averaged fields in the screening term and average
//       again
//    4) push in the averaged fields and deposit
//   The new slice carries the particles and densities of the last push and
//   the last solved (not averaged) fields. Bz is always zero.
//
//   The driver owns the transverse grid, the plasma ensemble, the
//   depositor, the pusher and the two field solvers, and the work buffers
//   that are reused between steps.
//
#ifndef QSW_STEP_DRIVER_H
#define QSW_STEP_DRIVER_H

#include <vector>

#include "Types/ViewTypes.h"

#include "Config/SimulationParameters.h"
#include "Deposition/Depositor.h"
#include "FieldSolvers/DirichletSolver.h"
#include "FieldSolvers/FieldSources.h"
#include "FieldSolvers/MixedBoundarySolver.h"
#include "Grid/GridGeometry.h"
#include "Plasma/PlasmaParticles.h"
#include "Plasma/Virtualization.h"
#include "Pusher/PlasmaPusher.h"
#include "State/SliceState.h"

namespace qsw {

    template <typename T>
    class StepDriver {
    public:
        using field_view_type = grid_view_type<T>;

        /*!
         * Validates the parameters and builds all components
         * @param params run configuration
         */
        explicit StepDriver(const SimulationParameters& params);

        /*!
         * Deposits the resting plasma once to obtain the ion background and
         * returns the unperturbed state in front of the beam
         */
        SliceState<T> initialState();

        /*!
         * Computes the next slice
         * @param beamRo beam charge density on the new slice
         * @param prev state on the previous slice
         * @return the new state (freshly allocated, independent of prev)
         */
        SliceState<T> step(const field_view_type& beamRo, const SliceState<T>& prev);

        const SimulationParameters& parameters() const { return params_m; }
        const GridGeometry<T>& grid() const { return grid_m; }
        const PlasmaParticles<T>& particles() const { return particles_m; }
        const VirtualizationTable<T>& virtualization() const { return table_m; }
        const Depositor<T>& depositor() const { return depositor_m; }

    private:
        void deposit(const ParticleState<T>& particles, const SourceSet<T>& sources);

        /*!
         * Solves all fields of the slice with the given densities
         * @param beamRo beam charge density
         * @param sources plasma densities on the new slice
         * @param prevSources plasma densities on the previous slice
         * @param sub fields entering the screening term
         * @param out the solved fields (Bz is not touched)
         */
        void solveFields(const field_view_type& beamRo, const SourceSet<T>& sources,
                         const SourceSet<T>& prevSources, const FieldSet<T>& sub,
                         const FieldSet<T>& out);

        // logs a warning if a solved field does not satisfy its equation
        void checkResiduals(const FieldSet<T>& solved);

        // out = (a + b) / 2 for Ex, Ey, Ez, Bx and By
        void average(const FieldSet<T>& a, const FieldSet<T>& b, const FieldSet<T>& out) const;

        SimulationParameters params_m;
        GridGeometry<T> grid_m;
        std::vector<T> coarseLattice_m;
        PlasmaParticles<T> particles_m;
        VirtualizationTable<T> table_m;
        Depositor<T> depositor_m;
        PlasmaPusher<T> pusher_m;
        FieldSources<T> fieldSources_m;
        MixedBoundarySolver<T> mixedSolver_m;
        DirichletSolver<T> dirichletSolver_m;

        // work buffers
        field_view_type estXOfft_m, estYOfft_m;
        ParticleState<T> trial_m[2];
        SourceSet<T> sources_m;
        FieldSet<T> rhs_m, solved_m, averaged_m;
    };
}  // namespace qsw

#include "Stepper/StepDriver.hpp"

#endif
