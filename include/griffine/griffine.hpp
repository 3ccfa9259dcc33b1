#pragma once

#include "griffine/affine.hpp"
#include "griffine/affine_grid.hpp"
#include "griffine/errors.hpp"
#include "griffine/grid.hpp"
#include "griffine/point.hpp"
#include "griffine/tile.hpp"
