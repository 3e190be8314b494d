//
// Class StepDriver
//   Advances the plasma response from one xi slice to the next.
//
#include <string>

#include "Qsw.h"
#include "Utility/Logging.h"
#include "Utility/ParallelDispatch.h"
#include "Utility/QswTimings.h"

#include "FieldSolvers/ResidualCheck.h"
#include "Plasma/PlasmaLattice.h"

namespace qsw {

    namespace detail {
        inline const SimulationParameters& validated(const SimulationParameters& params) {
            params.validate();
            return params;
        }
    }  // namespace detail

    template <typename T>
    StepDriver<T>::StepDriver(const SimulationParameters& params)
        : params_m(detail::validated(params))
        , grid_m(params.gridSteps, T(params.gridStepSize), params.reflectPaddingSteps)
        , coarseLattice_m(makeCoarseLattice<T>(params.plasmaSteps(), T(params.gridStepSize),
                                               params.plasmaCoarseness))
        , particles_m(coarseLattice_m, params.plasmaCoarseness)
        , table_m(coarseLattice_m,
                  makeFineLattice<T>(params.plasmaSteps(), T(params.gridStepSize),
                                     params.plasmaFineness),
                  T(params.gridStepSize * params.plasmaCoarseness))
        , depositor_m(grid_m, table_m, particles_m, params.plasmaCoarseness,
                      params.plasmaFineness)
        , pusher_m(grid_m, particles_m, T(params.xiStepSize))
        , fieldSources_m(grid_m, T(params.xiStepSize), T(params.subtractionTrick))
        , mixedSolver_m(params.gridSteps, T(params.gridStepSize), T(params.subtractionTrick))
        , dirichletSolver_m(params.gridSteps, T(params.gridStepSize)) {
        const int n  = grid_m.size();
        const int nc = particles_m.count();

        estXOfft_m = field_view_type("estimated_x_offt", nc, nc);
        estYOfft_m = field_view_type("estimated_y_offt", nc, nc);
        trial_m[0] = ParticleState<T>::zeros(nc);
        trial_m[1] = ParticleState<T>::zeros(nc);
        sources_m  = SourceSet<T>::zeros(n);
        rhs_m      = FieldSet<T>::zeros(n);
        solved_m   = FieldSet<T>::zeros(n);
        averaged_m = FieldSet<T>::zeros(n);
    }

    template <typename T>
    SliceState<T> StepDriver<T>::initialState() {
        auto state = SliceState<T>::zeros(particles_m.count(), grid_m.size());

        const auto& p = state.particles;
        depositor_m.initialDeposition(p.xOfft, p.yOfft, p.px, p.py, p.pz);

        // the resting plasma plus its background is neutral; the densities
        // of the slice in front of the beam are taken to be exactly zero
        return state;
    }

    template <typename T>
    void StepDriver<T>::deposit(const ParticleState<T>& particles, const SourceSet<T>& sources) {
        static QswTimings::TimerRef depositTimer = QswTimings::getTimer("deposit");
        QswTimings::startTimer(depositTimer);

        depositor_m.deposit(particles.xOfft, particles.yOfft, particles.px, particles.py,
                            particles.pz, sources.ro, sources.jx, sources.jy, sources.jz);

        QswTimings::stopTimer(depositTimer);
    }

    template <typename T>
    void StepDriver<T>::solveFields(const field_view_type& beamRo, const SourceSet<T>& sources,
                                    const SourceSet<T>& prevSources, const FieldSet<T>& sub,
                                    const FieldSet<T>& out) {
        static QswTimings::TimerRef mixedTimer     = QswTimings::getTimer("solveMixed");
        static QswTimings::TimerRef dirichletTimer = QswTimings::getTimer("solveDirichlet");

        QswTimings::startTimer(mixedTimer);
        fieldSources_m.mixed(sources, prevSources, beamRo, sub, rhs_m);
        mixedSolver_m.solve(rhs_m.Ex, out.Ex, SweepAxis::Y);
        mixedSolver_m.solve(rhs_m.Ey, out.Ey, SweepAxis::X);
        mixedSolver_m.solve(rhs_m.Bx, out.Bx, SweepAxis::X);
        mixedSolver_m.solve(rhs_m.By, out.By, SweepAxis::Y);
        QswTimings::stopTimer(mixedTimer);

        QswTimings::startTimer(dirichletTimer);
        fieldSources_m.longitudinal(sources, rhs_m.Ez);
        dirichletSolver_m.solve(rhs_m.Ez, out.Ez);
        QswTimings::stopTimer(dirichletTimer);

        if (params_m.checkResidual) {
            checkResiduals(out);
        }
    }

    template <typename T>
    void StepDriver<T>::checkResiduals(const FieldSet<T>& solved) {
        const T s   = mixedSolver_m.screening();
        const T h   = grid_m.stepSize();
        const T tol = params_m.residualTolerance;

        auto report = [&](const char* name, T residual) {
            SPDLOG_DEBUG("residual of {}: {}", name, residual);
            if (residual > tol) {
                *Warn << "Relative residual of " << name << " is " << residual
                      << ", above the tolerance " << tol << endl;
            }
        };

        report("Ex", mixedResidual(solved.Ex, rhs_m.Ex, s, h, SweepAxis::Y));
        report("Ey", mixedResidual(solved.Ey, rhs_m.Ey, s, h, SweepAxis::X));
        report("Bx", mixedResidual(solved.Bx, rhs_m.Bx, s, h, SweepAxis::X));
        report("By", mixedResidual(solved.By, rhs_m.By, s, h, SweepAxis::Y));
        report("Ez", dirichletResidual(solved.Ez, rhs_m.Ez, h));
    }

    template <typename T>
    void StepDriver<T>::average(const FieldSet<T>& a, const FieldSet<T>& b,
                                const FieldSet<T>& out) const {
        Kokkos::parallel_for(
            "StepDriver::average", getRangePolicy(out.Ex),
            KOKKOS_LAMBDA(const int i, const int j) {
                out.Ex(i, j) = (a.Ex(i, j) + b.Ex(i, j)) / 2;
                out.Ey(i, j) = (a.Ey(i, j) + b.Ey(i, j)) / 2;
                out.Ez(i, j) = (a.Ez(i, j) + b.Ez(i, j)) / 2;
                out.Bx(i, j) = (a.Bx(i, j) + b.Bx(i, j)) / 2;
                out.By(i, j) = (a.By(i, j) + b.By(i, j)) / 2;
            });
    }

    template <typename T>
    SliceState<T> StepDriver<T>::step(const field_view_type& beamRo, const SliceState<T>& prev) {
        static QswTimings::TimerRef stepTimer     = QswTimings::getTimer("step");
        static QswTimings::TimerRef estimateTimer = QswTimings::getTimer("estimate");
        static QswTimings::TimerRef pushTimer     = QswTimings::getTimer("push");

        const int n  = grid_m.size();
        const int nc = particles_m.count();
        if (static_cast<int>(beamRo.extent(0)) != n || static_cast<int>(beamRo.extent(1)) != n) {
            throw QswException("StepDriver::step()",
                               "The beam density does not match the grid.");
        }
        if (static_cast<int>(prev.particles.xOfft.extent(0)) != nc
            || static_cast<int>(prev.particles.xOfft.extent(1)) != nc) {
            throw QswException("StepDriver::step()",
                               "The particle state does not match the ensemble.");
        }

        QswTimings::startTimer(stepTimer);

        const auto& prevParticles = prev.particles;

        // 1. field-free predictor
        QswTimings::startTimer(estimateTimer);
        pusher_m.estimate(prevParticles, estXOfft_m, estYOfft_m);
        QswTimings::stopTimer(estimateTimer);

        // 2. push in the previous fields
        SPDLOG_DEBUG("step: first pass");
        QswTimings::startTimer(pushTimer);
        pusher_m.push(prevParticles, estXOfft_m, estYOfft_m, prev.fields, trial_m[0]);
        QswTimings::stopTimer(pushTimer);
        deposit(trial_m[0], sources_m);
        solveFields(beamRo, sources_m, prev.sources, prev.fields, solved_m);
        average(solved_m, prev.fields, averaged_m);

        // 3. push in the averaged fields
        SPDLOG_DEBUG("step: second pass");
        QswTimings::startTimer(pushTimer);
        pusher_m.push(prevParticles, trial_m[0].xOfft, trial_m[0].yOfft, averaged_m, trial_m[1]);
        QswTimings::stopTimer(pushTimer);
        deposit(trial_m[1], sources_m);
        solveFields(beamRo, sources_m, prev.sources, averaged_m, solved_m);
        average(solved_m, prev.fields, averaged_m);

        // 4. final push in the corrected fields
        SPDLOG_DEBUG("step: final pass");
        SliceState<T> next;
        next.particles = ParticleState<T>::zeros(nc);
        next.sources   = SourceSet<T>::zeros(n);

        QswTimings::startTimer(pushTimer);
        pusher_m.push(prevParticles, trial_m[1].xOfft, trial_m[1].yOfft, averaged_m,
                      next.particles);
        QswTimings::stopTimer(pushTimer);
        deposit(next.particles, next.sources);

        using detail::cloneView;
        next.fields = {cloneView(solved_m.Ex), cloneView(solved_m.Ey), cloneView(solved_m.Ez),
                       cloneView(solved_m.Bx), cloneView(solved_m.By),
                       field_view_type("Bz", n, n)};

        Kokkos::fence();
        QswTimings::stopTimer(stepTimer);
        return next;
    }
}  // namespace qsw
