#pragma once

#include "ambient.hpp"
#include "concept.hpp"
#include "context.hpp"
#include "context_slot.hpp"
#include "from_coroutine.hpp"
#include "machine.hpp"
#include "pending.hpp"
#include "pinned.hpp"
#include "poll_state.hpp"
#include "ready.hpp"
#include "resume_state.hpp"
#include "yield.hpp"
