#pragma once

#include "flowstore/v1/flow.pb.h"
#include "flowstore/v1/project.pb.h"
#include "flowstore/v1/properties.pb.h"
