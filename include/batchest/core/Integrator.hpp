#pragma once

#include "batchest/core/Models.hpp"

namespace batchest {

// Converts continuous dynamics to one discrete transition over [t0, t1] with
// `substeps` fixed RK4 steps. With `withSensitivities` the state is integrated
// together with
//   dPhi/dt   = A Phi,       Phi(t0)   = I
//   dGamma/dt = A Gamma + D, Gamma(t0) = 0
// and Phi(t1), Gamma(t1) are returned as F and Gamma. Otherwise F and Gamma
// are left empty. Exceptions thrown by `dynamics` propagate unchanged.
DiscreteTransition_t discretizeRk4(const ContinuousDynamics_t& dynamics,
                                   const Vector& x,
                                   const Vector& u,
                                   const Vector& v,
                                   double t0,
                                   double t1,
                                   int substeps,
                                   bool withSensitivities);

} // namespace batchest
