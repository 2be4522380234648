#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. lucid_core/types/chunk.hpp),
// users can simply do `#include "lucid_core/types.hpp"`.
//
#include "lucid_core/types/chat.hpp"
#include "lucid_core/types/chunk.hpp"
#include "lucid_core/types/query.hpp"
