#pragma once

#include "checkout/manager/v1/types.pb.h"

#include "checkout/manager/v1/checkout_service.pb.h"
#include "checkout/manager/v1/payment_service.pb.h"

#include "checkout/manager/v1/checkout_service.grpc.pb.h"
#include "checkout/manager/v1/payment_service.grpc.pb.h"
