//
// Struct ViewType
//   Kokkos::Views of different dimensions.
//
#ifndef QSW_VIEW_TYPES_H
#define QSW_VIEW_TYPES_H

#include <Kokkos_Complex.hpp>
#include <Kokkos_Core.hpp>

namespace qsw {
    /**
     * @file ViewTypes.h
     * Multi-dimensional arrays for grid fields, particle attributes and
     * transform buffers. Grid fields and particle arrays are two dimensional
     * and stored row major, so that a grid row is contiguous in memory.
     */
    namespace detail {
        /*!
         * Recursively templated struct for defining pointers with arbitrary
         * indirection depth.
         * @tparam T data type
         * @tparam N indirection level
         */
        template <typename T, int N>
        struct NPtr {
            typedef typename NPtr<T, N - 1>::type* type;
        };

        /*!
         * Base case template specialization for a simple pointer.
         */
        template <typename T>
        struct NPtr<T, 1> {
            typedef T* type;
        };

        /*!
         * View type for an arbitrary number of dimensions.
         * @tparam T view data type
         * @tparam Dim view dimension
         * @tparam Properties further template parameters of Kokkos
         */
        template <typename T, unsigned Dim, class... Properties>
        struct ViewType {
            typedef Kokkos::View<typename NPtr<T, Dim>::type, Properties...> view_type;
        };
    }  // namespace detail

    // N x N grid fields and Nc x Nc particle attribute arrays
    template <typename T>
    using grid_view_type = typename detail::ViewType<T, 2, Kokkos::LayoutRight>::view_type;

    // one dimensional arrays (lattice coordinates, index tables)
    template <typename T>
    using line_view_type = typename detail::ViewType<T, 1>::view_type;

    // batched transform buffers: one contiguous row per transform
    template <typename T>
    using complex_grid_view_type =
        typename detail::ViewType<Kokkos::complex<T>, 2, Kokkos::LayoutRight>::view_type;
}  // namespace qsw

#endif
