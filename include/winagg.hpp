#pragma once

#include "winagg/agg/count.hpp"
#include "winagg/agg/functor.hpp"
#include "winagg/agg/sum.hpp"
#include "winagg/chrono.hpp"
#include "winagg/common.hpp"
#include "winagg/errors.hpp"
#include "winagg/keyed_window_agg.hpp"
#include "winagg/log.hpp"
#include "winagg/record.hpp"
#include "winagg/time_window.hpp"
#include "winagg/window_assigner.hpp"
#include "winagg/window_emitter.hpp"
#include "winagg/window_options.hpp"
#include "winagg/windowed.hpp"
