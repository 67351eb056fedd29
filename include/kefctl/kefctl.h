#pragma once

#include "kefctl/controller.h"
#include "kefctl/discovery.h"
#include "kefctl/result_slot.h"
#include "kefctl/transport.h"
#include "kefctl/types.h"
