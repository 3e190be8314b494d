//
// Class FieldSources
//   Right hand sides of the transverse field equations of one slice. The
//   transverse derivatives are centered differences with step 2h and are
//   set to zero on the two perimeter lines of the differentiated axis; the
//   longitudinal derivatives are backward differences between the previous
//   and the current slice.
//
//   With s the subtraction trick weight and the *_sub fields the current
//   best guess of the solution, the mixed boundary right hand sides are
//      Ex_rhs = -((d(ro + ro_b)/dx - djx/dxi) - s * Ex_sub)
//      Ey_rhs = -((d(ro + ro_b)/dy - djy/dxi) - s * Ey_sub)
//      Bx_rhs = +((d(jz + ro_b)/dy - djy/dxi) + s * Bx_sub)
//      By_rhs = -((d(jz + ro_b)/dx - djx/dxi) - s * By_sub)
//   with djx/dxi = (jx_prev - jx) / dxi, and the longitudinal one is
//      Ez_rhs = -(djx/dx + djy/dy)
//   on the interior.
//
#ifndef QSW_FIELD_SOURCES_H
#define QSW_FIELD_SOURCES_H

#include "Types/ViewTypes.h"

#include "Grid/GridGeometry.h"
#include "State/SliceState.h"

namespace qsw {

    template <typename T>
    class FieldSources {
    public:
        using field_view_type = grid_view_type<T>;

        /*!
         * @param grid transverse grid
         * @param xiStepSize slice distance
         * @param subtractionTrick weight s of the screening term
         */
        FieldSources(const GridGeometry<T>& grid, T xiStepSize, T subtractionTrick);

        /*!
         * Fills rhs.Ex, rhs.Ey, rhs.Bx and rhs.By; the other members are not touched
         * @param sources densities of the current slice
         * @param prevSources densities of the previous slice (only jx, jy are read)
         * @param beamRo beam charge density of the current slice
         * @param sub fields entering the screening term
         * @param rhs output
         */
        void mixed(const SourceSet<T>& sources, const SourceSet<T>& prevSources,
                   const field_view_type& beamRo, const FieldSet<T>& sub,
                   const FieldSet<T>& rhs) const;

        /*!
         * Right hand side of the Ez equation; zero on the perimeter
         */
        void longitudinal(const SourceSet<T>& sources, const field_view_type& rhs) const;

    private:
        int n_m;
        T h_m;
        T xiStepSize_m;
        T subtractionTrick_m;
    };
}  // namespace qsw

#include "FieldSolvers/FieldSources.hpp"

#endif
