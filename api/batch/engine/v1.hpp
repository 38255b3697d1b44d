#pragma once

#include "batch/engine/v1/job.pb.h"
#include "batch/engine/v1/job_service.pb.h"
#include "batch/engine/v1/job_service.grpc.pb.h"
