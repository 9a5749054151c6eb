#pragma once

// This is the single entry-point for the Strata library.
// Include this file to get access to all the core functionality.

#include "strata/access.hpp"
#include "strata/debug.hpp"
#include "strata/device.hpp"
#include "strata/dispatch.hpp"
#include "strata/dtype.hpp"
#include "strata/error.hpp"
#include "strata/io.hpp"
#include "strata/operations.hpp"
#include "strata/parallel.hpp"
#include "strata/shape.hpp"
#include "strata/storage.hpp"
#include "strata/system.hpp"
#include "strata/tensor.hpp"
