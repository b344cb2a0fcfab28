#pragma once

// Cross-validated training workflow built on the stepflow engine:
//   - training/interfaces.hpp: dataset, transformer, model, tracker and registry seams
//   - training/kfold.hpp: k-fold index splitting
//   - training/pipeline.hpp: the training graph, its parameters and tracking initializer

#include "training/interfaces.hpp"
#include "training/kfold.hpp"
#include "training/pipeline.hpp"
