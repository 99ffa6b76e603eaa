#pragma once

#include "boolean_indicator.hpp"
#include "breathe.hpp"
#include "common.hpp"
#include "countdown.hpp"
#include "range_value.hpp"
#include "state_indicator.hpp"
