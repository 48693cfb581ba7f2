#pragma once

// Umbrella header for auras::effects module

#include <auras/effects/value.hpp>
#include <auras/effects/errors.hpp>
#include <auras/effects/effect_instance.hpp>
#include <auras/effects/effect_definition.hpp>
#include <auras/effects/aura_definition.hpp>
#include <auras/effects/effect_calculator.hpp>
#include <auras/effects/object_state.hpp>
#include <auras/effects/lifecycle_scheduler.hpp>
#include <auras/effects/aura_events.hpp>
#include <auras/effects/aura_system.hpp>
