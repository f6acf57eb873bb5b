#pragma once

#include <blas.hh>

namespace LinCalc {

using blas::Layout;
using blas::Op;

} // end namespace LinCalc
