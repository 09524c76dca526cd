#pragma once

// Umbrella header for the sumquery library

#include "sumquery/version.hpp"
#include "sumquery/numeric.hpp"
#include "sumquery/contract.hpp"
#include "sumquery/prefix_sum_index.hpp"
#include "sumquery/make.hpp"
