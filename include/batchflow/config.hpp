#pragma once

#ifndef BATCHFLOW_DEFAULT_DATA_NAME
#define BATCHFLOW_DEFAULT_DATA_NAME "default"
#endif

#ifndef BATCHFLOW_DEFAULT_FLIP_PROBABILITY
#define BATCHFLOW_DEFAULT_FLIP_PROBABILITY 0.5
#endif

#ifndef BATCHFLOW_DEFAULT_BATCH_SIZE
#define BATCHFLOW_DEFAULT_BATCH_SIZE 10
#endif
