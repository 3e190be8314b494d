//
// QswTypes
//   Physical constants used throughout Qsw
//
#ifndef QSW_TYPES_H
#define QSW_TYPES_H

namespace qsw {
    // plasma electrons in normalized units
    constexpr double ELECTRON_MASS   = 1;
    constexpr double ELECTRON_CHARGE = -1;
}  // namespace qsw

#endif
