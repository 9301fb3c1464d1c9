#pragma once

/// @file Units.hpp
/// @brief Umbrella header for the dimension-checked unit system.

#include <UOM/Units/Dimension.hpp>
#include <UOM/Units/Length.hpp>
#include <UOM/Units/Quantity.hpp>
#include <UOM/Units/Temperature.hpp>
#include <UOM/Units/UnitCatalog.hpp>
