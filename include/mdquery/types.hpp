#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. mdquery/types/file_type.hpp),
// users can simply do `#include "mdquery/types.hpp"`.
//
#include "mdquery/types/attribute_value.hpp"
#include "mdquery/types/file_type.hpp"
