#pragma once

#include "resonance/graph/v1/node.pb.h"
#include "resonance/graph/v1/signal.pb.h"
#include "resonance/graph/v1/source.pb.h"
#include "resonance/graph/v1/link.pb.h"
#include "resonance/graph/v1/migration.pb.h"
