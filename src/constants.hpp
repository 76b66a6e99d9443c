/*
  This file is part of the haplo-lib haplogroup classification
  software suite.
  Copyright (C) 2025 haplo-lib Developers.

  This program is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  This program is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef HAPLO_LIB_CONSTANTS_H
#define HAPLO_LIB_CONSTANTS_H

#include <string>

namespace hgl {

/**
 * The default max for potentially concurrent tasks, used if the number of cores cannot be determined at
 * runtime.
 */
constexpr unsigned default_max_tasks = 16u;

/**
 * Version written to (and required in) the `payload_file_version` attribute of payload cache files.
 */
constexpr int payload_file_version = 1;

/**
 * Calculate the default number of potentially concurrent tasks for utilities that may be run asynchronously.
 *
 * This is the number of cores detected at runtime, unless this cannot be detected, in which case it is
 * default_max_tasks.
 *
 * The result is cached to ensure the computation is performed at most once each time haplo-lib is run.
 *
 * @return the default number of potentially concurrent tasks
 */
unsigned get_default_concurrency();

/**
 * Directory used for the durable payload cache when the caller does not name one.
 *
 * Resolved in order: the HAPLO_LIB_CACHE_DIR environment variable, $HOME/.cache/haplo-lib, and finally
 * haplo-lib under the system temporary directory. The directory is not created here.
 *
 * @return path of the default cache directory
 */
std::string default_cache_dir();

}

#endif // HAPLO_LIB_CONSTANTS_H
