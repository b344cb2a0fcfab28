#pragma once

#include "execution.hpp"
#include "log.hpp"
#include "workflow/artifact.hpp"
#include "workflow/artifact_store.hpp"
#include "workflow/branch_path.hpp"
#include "workflow/context.hpp"
#include "workflow/engine.hpp"
#include "workflow/errors.hpp"
#include "workflow/gate.hpp"
#include "workflow/graph.hpp"
#include "workflow/merge.hpp"
#include "workflow/parameters.hpp"
#include "workflow/run.hpp"
#include "workflow/step.hpp"
