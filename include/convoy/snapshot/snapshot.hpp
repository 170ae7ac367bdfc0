#pragma once

/// @file snapshot.hpp
/// @brief Main include header for convoy_snapshot

#include "fwd.hpp"
#include "types.hpp"
#include "paint.hpp"
#include "cargo.hpp"
#include "barricade.hpp"
#include "structure.hpp"
#include "vehicle.hpp"
#include "service.hpp"
#include "codec.hpp"
