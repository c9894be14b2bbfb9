#pragma once

#include "batchflow/augmentation.hpp"
#include "batchflow/config.hpp"
#include "batchflow/core.hpp"
#include "batchflow/data_iterator.hpp"
#include "batchflow/errors.hpp"
#include "batchflow/iterators.hpp"
#include "batchflow/progress.hpp"
#include "batchflow/random_state.hpp"
#include "batchflow/tensor_ops.hpp"
#include "batchflow/validation.hpp"
