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

#ifndef HAPLO_LIB_FETCHER_H
#define HAPLO_LIB_FETCHER_H

#include <string>

/**
 * @brief Outcome of a single download attempt.
 */
struct FetchResult {
  bool ok = false;
  std::string body;
  // Human-readable cause when ok is false
  std::string error;

  static FetchResult success(std::string body);
  static FetchResult failure(std::string error);
};

/**
 * @class Fetcher
 * @brief Performs one blocking GET per call. Implementations never retry.
 */
class Fetcher {
public:
  virtual ~Fetcher() = default;
  virtual FetchResult fetch(const std::string& url) = 0;
};

/**
 * @class CurlFetcher
 * @brief Fetcher backed by libcurl. Follows redirects and accepts compressed transfer encodings; an HTTP status
 * of 400 or above is a failure.
 */
class CurlFetcher : public Fetcher {
public:
  explicit CurlFetcher(long _timeout_seconds = 300, std::string _user_agent = "haplo-lib");
  FetchResult fetch(const std::string& url) override;

private:
  long timeout_seconds;
  std::string user_agent;
};

#endif // HAPLO_LIB_FETCHER_H
