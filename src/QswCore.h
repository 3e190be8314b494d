//
// QswCore
//   Core header files.
//
#ifndef QSW_CORE_H
#define QSW_CORE_H

#include "Qsw.h"

// Qsw utilities
#include "Utility/ParameterList.h"
#include "Utility/QswException.h"
#include "Utility/QswTimings.h"

#include "Config/SimulationParameters.h"
#include "Grid/GridGeometry.h"

// plasma and its interpolation
#include "Plasma/PlasmaLattice.h"
#include "Plasma/PlasmaParticles.h"
#include "Plasma/Virtualization.h"
#include "Interpolation/QuadraticSpline.h"
#include "Deposition/Depositor.h"
#include "Pusher/PlasmaPusher.h"

// field solvers
#include "FFT/BatchedRealFFT.h"
#include "FieldSolvers/DirichletSolver.h"
#include "FieldSolvers/FieldSources.h"
#include "FieldSolvers/MixedBoundarySolver.h"
#include "FieldSolvers/ResidualCheck.h"

// slice stepping
#include "State/SliceState.h"
#include "Stepper/StepDriver.h"
#include "Stepper/Simulation.h"

#include "Beam/GaussianBeam.h"
#include "Diagnostics/OnAxisHistory.h"
#include "Manager/SliceManager.h"

#endif
