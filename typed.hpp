/**
 * @file typed.hpp
 * @brief Umbrella header for the typed collections library
 *
 * Includes everything: dynamic values, type constraints, the arbitrary-key
 * store and the Sequence, Dictionary and Set collections.
 */

#pragma once

#include "typed_errors.hpp"
#include "typed_value.hpp"
#include "typed_typeset.hpp"
#include "typed_store.hpp"
#include "typed_collections.hpp"
