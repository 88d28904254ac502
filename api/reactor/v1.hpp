#pragma once

#include "reactor/v1/agent.pb.h"
#include "reactor/v1/event.pb.h"
#include "reactor/v1/subscription.pb.h"
