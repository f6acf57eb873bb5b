#pragma once

#include <lapack.hh>

namespace LinCalc {

using lapack::Norm;

} // end namespace LinCalc
