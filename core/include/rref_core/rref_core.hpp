#pragma once

#include "rref_core/classify.hpp"
#include "rref_core/config.hpp"
#include "rref_core/error.hpp"
#include "rref_core/latex.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/present.hpp"
#include "rref_core/rational.hpp"
#include "rref_core/row_ops.hpp"
#include "rref_core/row_reduction.hpp"
#include "rref_core/solver.hpp"
#include "rref_core/steps.hpp"
