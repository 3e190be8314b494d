//
// Parallel dispatch
//   Execution policies for the slice kernels. Grid fields and particle
//   arrays are two dimensional views and are traversed with an MDRange
//   over (i, j); spectral sweeps run one thread per line.
//
#ifndef QSW_PARALLEL_DISPATCH_H
#define QSW_PARALLEL_DISPATCH_H

#include <Kokkos_Core.hpp>

namespace qsw {
    /*!
     * Range policy type of a given rank
     * @tparam Dim range policy rank
     * @tparam PolicyArgs... additional template parameters for the range policy
     */
    template <unsigned Dim, class... PolicyArgs>
    struct RangePolicy {
        using policy_type = Kokkos::MDRangePolicy<PolicyArgs..., Kokkos::Rank<Dim>>;
        using index_type  = typename policy_type::array_index_type;
    };

    template <class... PolicyArgs>
    struct RangePolicy<1, PolicyArgs...> {
        using policy_type = Kokkos::RangePolicy<PolicyArgs...>;
        using index_type  = typename policy_type::index_type;
    };

    /*!
     * Policy spanning a whole view, or only its interior when shift > 0
     * @param view the view to traverse
     * @param shift number of perimeter nodes to skip on each side
     */
    template <class... PolicyArgs, typename View>
    typename RangePolicy<View::rank, typename View::execution_space, PolicyArgs...>::policy_type
    getRangePolicy(const View& view, int shift = 0) {
        constexpr unsigned Dim = View::rank;
        using exec_space       = typename View::execution_space;
        using range_type       = RangePolicy<Dim, exec_space, PolicyArgs...>;
        using policy_type      = typename range_type::policy_type;
        if constexpr (Dim == 1) {
            return policy_type(shift, view.extent(0) - shift);
        } else {
            Kokkos::Array<typename range_type::index_type, Dim> begin, end;
            for (unsigned d = 0; d < Dim; ++d) {
                begin[d] = shift;
                end[d]   = view.extent(d) - shift;
            }
            return policy_type(begin, end);
        }
    }

    /*!
     * One thread per line, for the tridiagonal sweeps along the columns of
     * a transformed field
     * @param lines number of independent lines
     */
    template <class... PolicyArgs>
    typename RangePolicy<1, PolicyArgs...>::policy_type getLinePolicy(int lines) {
        return typename RangePolicy<1, PolicyArgs...>::policy_type(0, lines);
    }
}  // namespace qsw

#endif
