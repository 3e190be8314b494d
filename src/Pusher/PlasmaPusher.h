//
// Class PlasmaPusher
//   Advances the coarse plasma electrons by one xi step. Positions are
//   stored as offsets from the initial lattice positions, and the particles
//   move with the velocity p / (gamma_m - pz) in units of the xi step.
//
//   estimate() is a field-free predictor that only drifts the particles.
//   push() integrates the equations of motion in given fields evaluated at
//   the half-step position: the momentum change is iterated twice at the
//   half-step momentum, the position is advanced with the half-step
//   momentum, and the full change is then applied to the momentum.
//
//   Both reflect particles at the walls x, y = +-b: the position is
//   mirrored back into the box. push() also reverses the corresponding
//   transverse momentum, estimate() leaves momenta untouched.
//
#ifndef QSW_PLASMA_PUSHER_H
#define QSW_PLASMA_PUSHER_H

#include "Types/ViewTypes.h"

#include "Grid/GridGeometry.h"
#include "Plasma/PlasmaParticles.h"
#include "State/SliceState.h"

namespace qsw {

    template <typename T>
    class PlasmaPusher {
    public:
        using attribute_view_type = grid_view_type<T>;

        /*!
         * @param grid transverse grid (node spacing and reflecting walls)
         * @param particles mass, charge and initial positions of the ensemble
         * @param xiStepSize slice distance
         */
        PlasmaPusher(const GridGeometry<T>& grid, const PlasmaParticles<T>& particles,
                     T xiStepSize);

        /*!
         * Drifts the particles without fields
         * @param prev state on the previous slice
         * @param xOfft estimated x offsets (output)
         * @param yOfft estimated y offsets (output)
         */
        void estimate(const ParticleState<T>& prev, const attribute_view_type& xOfft,
                      const attribute_view_type& yOfft) const;

        /*!
         * Moves the particles in the given fields
         * @param prev state on the previous slice
         * @param estXOfft estimate of the x offsets on the new slice
         * @param estYOfft estimate of the y offsets on the new slice
         * @param fields fields at the half step (Bz is ignored)
         * @param next new state (output; must not share views with the inputs)
         */
        void push(const ParticleState<T>& prev, const attribute_view_type& estXOfft,
                  const attribute_view_type& estYOfft, const FieldSet<T>& fields,
                  const ParticleState<T>& next) const;

    private:
        GridGeometry<T> grid_m;
        PlasmaParticles<T> particles_m;
        T xiStepSize_m;
    };
}  // namespace qsw

#include "Pusher/PlasmaPusher.hpp"

#endif
