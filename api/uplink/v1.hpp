#pragma once

#include "uplink/v1/segment.grpc.pb.h"
#include "uplink/v1/segment.pb.h"

#include "config/config.pb.h"
