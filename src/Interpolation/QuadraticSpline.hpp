//
// QuadraticSpline
//   Second order grid interpolation on the transverse grid.
//

namespace qsw {
    namespace detail {
        template <typename T>
        KOKKOS_INLINE_FUNCTION SplineStencil<T> splineStencil(T x, T y, int gridSteps, T h) {
            // shift by half a cell so that floor() yields the nearest node;
            // the local offsets then run from -1/2 to 1/2
            const T xh = x / h + T(0.5);
            const T yh = y / h + T(0.5);
            const T fx = Kokkos::floor(xh);
            const T fy = Kokkos::floor(yh);
            const T dx = xh - fx - T(0.5);
            const T dy = yh - fy - T(0.5);

            SplineStencil<T> s;
            s.i = static_cast<int>(fx) + gridSteps / 2;
            s.j = static_cast<int>(fy) + gridSteps / 2;

            s.wx[0] = (T(0.5) - dx) * (T(0.5) - dx) / 2;
            s.wx[1] = T(0.75) - dx * dx;
            s.wx[2] = (T(0.5) + dx) * (T(0.5) + dx) / 2;

            s.wy[0] = (T(0.5) - dy) * (T(0.5) - dy) / 2;
            s.wy[1] = T(0.75) - dy * dy;
            s.wy[2] = (T(0.5) + dy) * (T(0.5) + dy) / 2;
            return s;
        }

        template <unsigned long Point, typename View, typename T>
        KOKKOS_INLINE_FUNCTION void scatterToPoint(const View& view,
                                                   const SplineStencil<T>& stencil, T val) {
            constexpr int a = Point % 3;
            constexpr int b = Point / 3;
            Kokkos::atomic_add(&view(stencil.i + a - 1, stencil.j + b - 1),
                               val * (stencil.wx[a] * stencil.wy[b]));
        }

        template <unsigned long... Point, typename View, typename T>
        KOKKOS_INLINE_FUNCTION void scatterToField(const std::index_sequence<Point...>&,
                                                   const View& view,
                                                   const SplineStencil<T>& stencil, T val) {
            (scatterToPoint<Point>(view, stencil, val), ...);
        }

        template <unsigned long Point, typename View, typename T>
        KOKKOS_INLINE_FUNCTION typename View::value_type gatherFromPoint(
            const View& view, const SplineStencil<T>& stencil) {
            constexpr int a = Point % 3;
            constexpr int b = Point / 3;
            return (stencil.wx[a] * stencil.wy[b]) * view(stencil.i + a - 1, stencil.j + b - 1);
        }

        template <unsigned long... Point, typename View, typename T>
        KOKKOS_INLINE_FUNCTION typename View::value_type gatherFromField(
            const std::index_sequence<Point...>&, const View& view,
            const SplineStencil<T>& stencil) {
            return (gatherFromPoint<Point>(view, stencil) + ...);
        }
    }  // namespace detail
}  // namespace qsw
