#pragma once

// Umbrella header for ark
#include "error.h"
#include "value.h"
#include "name_space.h"
#include "subscript_codec.h"
#include "alliteration.h"
#include "permutation_pool.h"
#include "registry.h"
#include "fingerprint.h"
#include "allocation_engine.h"
#include "name_parts.h"
#include "log.h"
#include "archive.h"
