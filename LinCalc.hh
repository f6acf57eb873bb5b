#ifndef LINCALC_HH
#define LINCALC_HH

// config and dependencies
#include "LinCalc/lc_blaspp.hh"
#include "LinCalc/lc_lapackpp.hh"
#include "LinCalc/lc_macros.hh"
#include "RandBLAS.hh"

// misc
#include "LinCalc/misc/lc_status.hh"
#include "LinCalc/misc/lc_matrix.hh"
#include "LinCalc/misc/lc_util.hh"
#include "LinCalc/misc/lc_format.hh"
#include "LinCalc/misc/lc_parse.hh"
#include "LinCalc/misc/lc_gen.hh"
#include "LinCalc/misc/lc_config.hh"

// Computational routines
#include "LinCalc/comps/lc_array_ops.hh"
#include "LinCalc/comps/lc_reduce.hh"

// Drivers
#include "LinCalc/drivers/lc_calculator.hh"

#endif
