#pragma once

#include "strata/backends.hpp"
#include "strata/buffer.hpp"
#include "strata/codec.hpp"
#include "strata/compressors.hpp"
#include "strata/config.hpp"
#include "strata/correctors.hpp"
#include "strata/descriptor.hpp"
#include "strata/encryptors.hpp"
#include "strata/error.hpp"
#include "strata/log.hpp"
#include "strata/pipeline.hpp"
#include "strata/store.hpp"
#include "strata/table.hpp"
#include "strata/tail.hpp"
#include "strata/value.hpp"
