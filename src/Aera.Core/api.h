#pragma once

#include "datastore.h"
#include "date_util.h"
#include "exception.h"
#include "math_util.h"
#include "poco.h"
#include "univariate_summary.h"

namespace aera {
/// \brief Top-level namespace for AERA Core C++ API
namespace core {}
} // namespace aera
