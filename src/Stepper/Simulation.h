//
// Class Simulation
//   Owns the step driver and the state of the current slice. Construction
//   validates the parameters, builds the plasma and the solvers and performs
//   the one-time ion background deposit; advance() then moves the state one
//   slice further behind the driver.
//
#ifndef QSW_SIMULATION_H
#define QSW_SIMULATION_H

#include <memory>

#include "Types/ViewTypes.h"

#include "Config/SimulationParameters.h"
#include "Grid/GridGeometry.h"
#include "State/SliceState.h"
#include "Stepper/StepDriver.h"
#include "Utility/QswTimings.h"

namespace qsw {

    /*!
     * Evaluates a beam charge density on the grid of a slice
     * @param beam callable beam(xiIndex, x, y) returning the density
     * @param xiIndex slice index (the slice lies at xi = -xiIndex * dxi)
     * @param grid transverse grid
     * @param beamRo output N x N device view
     */
    template <typename T, typename BeamFunction>
    void fillBeamDensity(const BeamFunction& beam, int xiIndex, const GridGeometry<T>& grid,
                         const grid_view_type<T>& beamRo) {
        auto host = Kokkos::create_mirror_view(beamRo);
        for (int i = 0; i < grid.size(); ++i) {
            for (int j = 0; j < grid.size(); ++j) {
                host(i, j) = beam(xiIndex, grid.coordinate(i), grid.coordinate(j));
            }
        }
        Kokkos::deep_copy(beamRo, host);
    }

    template <typename T>
    class Simulation {
    public:
        using field_view_type = grid_view_type<T>;

        explicit Simulation(const SimulationParameters& params)
            : driver_m(std::make_unique<StepDriver<T>>(params))
            , state_m(driver_m->initialState())
            , beamRo_m("beam_ro", params.gridSteps, params.gridSteps)
            , xiIndex_m(0) {}

        /*!
         * Computes the next slice in the given beam
         * @param beam callable beam(xiIndex, x, y)
         */
        template <typename BeamFunction>
        void advance(const BeamFunction& beam) {
            static QswTimings::TimerRef beamTimer = QswTimings::getTimer("beamDensity");
            QswTimings::startTimer(beamTimer);
            fillBeamDensity(beam, xiIndex_m, driver_m->grid(), beamRo_m);
            QswTimings::stopTimer(beamTimer);

            advance(beamRo_m);
        }

        /*!
         * Computes the next slice for a beam density already on the grid
         */
        void advance(const field_view_type& beamRo) {
            state_m = driver_m->step(beamRo, state_m);
            ++xiIndex_m;
        }

        // the most recent slice
        const SliceState<T>& state() const { return state_m; }

        // index of the next slice to compute
        int xiIndex() const { return xiIndex_m; }

        const StepDriver<T>& driver() const { return *driver_m; }

        const GridGeometry<T>& grid() const { return driver_m->grid(); }

        const SimulationParameters& parameters() const { return driver_m->parameters(); }

    private:
        std::unique_ptr<StepDriver<T>> driver_m;
        SliceState<T> state_m;
        field_view_type beamRo_m;
        int xiIndex_m;
    };
}  // namespace qsw

#endif
