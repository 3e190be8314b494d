//
// PlasmaLattice
//   One dimensional initial positions of the plasma macro-particles.
//
#include <string>

#include "Utility/QswException.h"

namespace qsw {
    namespace detail {
        // mirrors the right half onto the negative axis; the first element
        // of the right half is dropped from the mirror if it lies on zero
        template <typename T>
        std::vector<T> mirrorLattice(const std::vector<T>& right, bool dropZero) {
            std::vector<T> lattice;
            lattice.reserve(2 * right.size());
            const size_t first = dropZero ? 1 : 0;
            for (size_t k = right.size(); k > first; --k) {
                lattice.push_back(-right[k - 1]);
            }
            lattice.insert(lattice.end(), right.begin(), right.end());
            return lattice;
        }
    }  // namespace detail

    template <typename T>
    std::vector<T> makeCoarseLattice(int steps, T h, int coarseness) {
        if (coarseness < 1) {
            throw QswException("makeCoarseLattice",
                               "coarseness must be >= 1, got " + std::to_string(coarseness));
        }
        const T spacing = h * coarseness;
        const int half  = steps / (2 * coarseness);
        if (half < 1) {
            throw QswException("makeCoarseLattice", "The coarse plasma lattice is empty.");
        }

        std::vector<T> right(half);
        for (int k = 0; k < half; ++k) {
            right[k] = k * spacing;
        }
        return detail::mirrorLattice(right, true);
    }

    template <typename T>
    std::vector<T> makeFineLattice(int steps, T h, int fineness) {
        if (fineness < 1) {
            throw QswException("makeFineLattice",
                               "fineness must be >= 1, got " + std::to_string(fineness));
        }
        const T spacing = h / fineness;
        const int half  = steps / 2 * fineness;
        if (half < 1) {
            throw QswException("makeFineLattice", "The fine plasma lattice is empty.");
        }

        std::vector<T> right(half);
        const bool onAxis = (fineness % 2 == 1);
        for (int k = 0; k < half; ++k) {
            right[k] = onAxis ? k * spacing : (T(0.5) + k) * spacing;
        }
        return detail::mirrorLattice(right, onAxis);
    }
}  // namespace qsw
