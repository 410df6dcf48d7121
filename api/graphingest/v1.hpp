#pragma once

#include "graphingest/ingest/v1/events.pb.h"
#include "graphingest/ingest/v1/types.pb.h"

namespace graphingest::v1 {
using namespace ::graphingest::ingest::v1;
}
