//
// Struct SliceState
//   Everything that is handed from one xi slice to the next: the evolving
//   part of the coarse particles (offsets from their initial positions and
//   momenta), the electromagnetic fields and the deposited charge and
//   current densities. All arrays live in device memory. A host copy for
//   diagnostics is obtained with snapshot().
//
#ifndef QSW_SLICE_STATE_H
#define QSW_SLICE_STATE_H

#include "Types/ViewTypes.h"

namespace qsw {

    // offsets and momenta of the Nc x Nc coarse particles
    template <typename T>
    struct ParticleState {
        using view_type = grid_view_type<T>;

        view_type xOfft, yOfft, px, py, pz;

        static ParticleState zeros(int nc);

        ParticleState clone() const;
    };

    // N x N electromagnetic fields; Bz is carried but always zero
    template <typename T>
    struct FieldSet {
        using view_type = grid_view_type<T>;

        view_type Ex, Ey, Ez, Bx, By, Bz;

        static FieldSet zeros(int n);

        FieldSet clone() const;
    };

    // N x N charge and current densities
    template <typename T>
    struct SourceSet {
        using view_type = grid_view_type<T>;

        view_type ro, jx, jy, jz;

        static SourceSet zeros(int n);

        SourceSet clone() const;
    };

    template <typename T>
    struct HostSliceState;

    template <typename T>
    struct SliceState {
        ParticleState<T> particles;
        FieldSet<T> fields;
        SourceSet<T> sources;

        /*!
         * The state of an unperturbed plasma at rest without fields
         * @param nc number of coarse particles per axis
         * @param n number of grid nodes per axis
         */
        static SliceState zeros(int nc, int n);

        /*!
         * Deep copy of every array to host memory
         */
        HostSliceState<T> snapshot() const;
    };

    template <typename T>
    struct HostSliceState {
        using view_type = typename grid_view_type<T>::HostMirror;

        view_type xOfft, yOfft, px, py, pz;
        view_type Ex, Ey, Ez, Bx, By, Bz;
        view_type ro, jx, jy, jz;
    };
}  // namespace qsw

#include "State/SliceState.hpp"

#endif
