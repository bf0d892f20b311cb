#pragma once

#include <Math/Vector4D.h>

namespace eventmix::physics {

using FourVector = ROOT::Math::PxPyPzEVector;

// Scalar observables stored for every candidate and daughter.
struct Observables {
  double m{0.0};
  double pt{0.0};
  double y{0.0};
};

inline Observables ObservablesOf(const FourVector& p4) {
  return Observables{p4.M(), p4.Pt(), p4.Rapidity()};
}

}  // namespace eventmix::physics
