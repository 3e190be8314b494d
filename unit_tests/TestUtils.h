//
// Utilities for versatile unit testing
//

#ifndef TEST_UTILS_H
#define TEST_UTILS_H

#include <Kokkos_Core.hpp>
#include <cmath>
#include <tuple>
#include <type_traits>

#include "Types/ViewTypes.h"

#include "gtest/gtest.h"

template <typename>
struct TestForTypes;

/*!
 * Create a set of gtest types for all types in a given tuple
 */
template <typename... Types>
struct TestForTypes<std::tuple<Types...>> {
    using type = ::testing::Types<Types...>;
};

/*!
 * Numerical tolerance for equality checks for computed results
 * @tparam T precision
 */
template <typename T>
constexpr T tolerance = 10. * Kokkos::Experimental::epsilon_v<T>;

/*!
 * Verifies that two values are equal to the correct level of precision
 * @tparam T data type
 */
template <typename T>
void assertEqual(T valA, T valB) {
    if constexpr (std::is_same_v<T, double>) {
        ASSERT_DOUBLE_EQ(valA, valB);
    } else {
        ASSERT_FLOAT_EQ(valA, valB);
    }
};

/*!
 * Utility struct for defining relevant parameters for Qsw unit tests
 */
struct TestParams {
    using Precisions = std::tuple<double, float>;

    using tests = typename TestForTypes<Precisions>::type;
};

/*!
 * Creates an n x m device view and fills it on the host
 * @param label view label
 * @param f callable f(i, j)
 */
template <typename T, typename Function>
qsw::grid_view_type<T> makeGridView(const char* label, int n, int m, Function&& f) {
    qsw::grid_view_type<T> view(label, n, m);
    auto host = Kokkos::create_mirror_view(view);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < m; ++j) {
            host(i, j) = f(i, j);
        }
    }
    Kokkos::deep_copy(view, host);
    return view;
}

/*!
 * Host copy of a device view
 */
template <typename View>
typename View::HostMirror toHost(const View& view) {
    auto host = Kokkos::create_mirror_view(view);
    Kokkos::deep_copy(host, view);
    return host;
}

/*!
 * Maximum absolute value of a two dimensional host view
 */
template <typename HostView>
double maxAbs(const HostView& view) {
    double m = 0;
    for (size_t i = 0; i < view.extent(0); ++i) {
        for (size_t j = 0; j < view.extent(1); ++j) {
            m = std::max(m, std::abs(static_cast<double>(view(i, j))));
        }
    }
    return m;
}

/*!
 * Sum of all entries of a two dimensional host view
 */
template <typename HostView>
double sum(const HostView& view) {
    double s = 0;
    for (size_t i = 0; i < view.extent(0); ++i) {
        for (size_t j = 0; j < view.extent(1); ++j) {
            s += view(i, j);
        }
    }
    return s;
}

#endif
