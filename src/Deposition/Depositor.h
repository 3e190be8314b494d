//
// Class Depositor
//   Deposits charge density and current of the plasma electrons onto the
//   transverse grid. Every coarse particle is split into (C * F)^2 virtual
//   particles whose offsets, masses, charges and momenta are bilinear
//   interpolations of the four coarse particles bracketing them; each
//   virtual particle is then scattered with the quadratic spline.
//
//   For a virtual particle with mass m, charge q and momentum p the
//   deposited quantities are
//      gamma_m = sqrt(m^2 + |p|^2)
//      rho     = q / (1 - pz / gamma_m)
//      j       = p * rho / gamma_m
//   and the ion background rho_initial is added to rho at the end.
//
#ifndef QSW_DEPOSITOR_H
#define QSW_DEPOSITOR_H

#include "Types/ViewTypes.h"

#include "Grid/GridGeometry.h"
#include "Plasma/PlasmaParticles.h"
#include "Plasma/Virtualization.h"

namespace qsw {

    template <typename T>
    class Depositor {
    public:
        using field_view_type     = grid_view_type<T>;
        using attribute_view_type = grid_view_type<T>;

        /*!
         * @param grid transverse grid
         * @param table coarse-to-fine interpolation table
         * @param particles the coarse ensemble (mass, charge)
         * @param coarseness grid cells per coarse particle
         * @param fineness virtual particles per cell and axis
         */
        Depositor(const GridGeometry<T>& grid, const VirtualizationTable<T>& table,
                  const PlasmaParticles<T>& particles, int coarseness, int fineness);

        /*!
         * Deposits the ensemble in the given state. The outputs are
         * overwritten; rho includes the ion background.
         * @param xOfft coarse particle x offsets
         * @param yOfft coarse particle y offsets
         * @param px coarse particle momenta (x)
         * @param py coarse particle momenta (y)
         * @param pz coarse particle momenta (z)
         * @param ro output charge density
         * @param jx output current density (x)
         * @param jy output current density (y)
         * @param jz output current density (z)
         */
        void deposit(const attribute_view_type& xOfft, const attribute_view_type& yOfft,
                     const attribute_view_type& px, const attribute_view_type& py,
                     const attribute_view_type& pz, const field_view_type& ro,
                     const field_view_type& jx, const field_view_type& jy,
                     const field_view_type& jz) const;

        /*!
         * Computes the ion background from the unperturbed electrons: the
         * background is chosen so that the total charge density of the
         * resting plasma vanishes. Throws if any momentum is not exactly
         * zero.
         */
        void initialDeposition(const attribute_view_type& xOfft, const attribute_view_type& yOfft,
                               const attribute_view_type& px, const attribute_view_type& py,
                               const attribute_view_type& pz);

        const field_view_type& roInitial() const { return roInitial_m; }

        T smallnessFactor() const { return smallness_m; }

    private:
        GridGeometry<T> grid_m;
        VirtualizationTable<T> table_m;
        PlasmaParticles<T> particles_m;

        // 1 / (C * F)^2, the share of a coarse particle carried by a virtual one
        T smallness_m;

        field_view_type roInitial_m;
    };
}  // namespace qsw

#include "Deposition/Depositor.hpp"

#endif
