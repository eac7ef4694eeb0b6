#pragma once

#include "cloudsim/records/v1/records.pb.h"

namespace cloudsim::v1 {
using namespace ::cloudsim::records::v1;
}
