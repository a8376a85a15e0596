#pragma once

#include "graphflow/v1/events.pb.h"
#include "graphflow/v1/state.pb.h"
#include "graphflow/v1/trace.pb.h"
