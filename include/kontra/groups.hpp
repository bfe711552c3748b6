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


/**
 * \file groups.hpp
 * Documentation groups for the Kontra library
 *
 * This file contains only documentation and defines the main module groups
 * for organizing the API documentation.
 */

/**
 * \defgroup memory Memory Management
 * Garbage-collected allocation of terms and their containers
 */

/**
 * \defgroup core Core Components
 * Term model, printing and comparison of terms
 */

/**
 * \defgroup cps CPS Conversion
 * Passes converting terms into continuation-passing style
 *
 * This group contains the atomicity classifier, the application lifting
 * pass, wrappers for primitives and recursion, the CPS transformer itself and
 * the driver combining them.
 */

/**
 * \defgroup utils Utilities
 * Logging, timing and other helpers used throughout the library
 */
