/*
 * Kontra - continuation-passing style conversion for probabilistic programs
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "kontra/term.hpp"


namespace kon {

/**
 * Check if two terms are structurally equal
 *
 * Identifiers are compared by name.
 *
 * \ingroup core
 */
[[nodiscard]] bool
equal(term a, term b);

/**
 * Check if two terms are equal up to consistent renaming of bound identifiers
 *
 * Free variables must have the same names. Closures are compared by their
 * parameter and body only.
 *
 * \ingroup core
 */
[[nodiscard]] bool
alpha_equal(term a, term b);

} // namespace kon
