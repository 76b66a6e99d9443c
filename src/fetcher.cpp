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

#include "fetcher.hpp"

#include "utils.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace {

// Returns false if libcurl could not be initialised; the outcome is decided once per process
bool ensure_curl_initialized() {
  static const bool initialized = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  return initialized;
}

size_t append_to_string(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

} // namespace

FetchResult FetchResult::success(std::string body) {
  FetchResult result;
  result.ok = true;
  result.body = std::move(body);
  return result;
}

FetchResult FetchResult::failure(std::string error) {
  FetchResult result;
  result.ok = false;
  result.error = std::move(error);
  return result;
}

CurlFetcher::CurlFetcher(long _timeout_seconds, std::string _user_agent)
    : timeout_seconds(_timeout_seconds), user_agent(std::move(_user_agent)) {
  if (timeout_seconds < 0) {
    throw std::invalid_argument(THROW_LINE("Fetch timeout must be non-negative."));
  }
}

FetchResult CurlFetcher::fetch(const std::string& url) {
  if (!ensure_curl_initialized()) {
    return FetchResult::failure("curl_global_init failed");
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
  if (handle == nullptr) {
    return FetchResult::failure("unable to create a curl handle");
  }

  std::string body;
  char error_buffer[CURL_ERROR_SIZE];
  error_buffer[0] = '\0';

  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, timeout_seconds);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, append_to_string);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

  const CURLcode code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    std::string cause = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(code);
    return FetchResult::failure(cause);
  }

  long status = 0;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status >= 400) {
    return FetchResult::failure("HTTP status " + std::to_string(status));
  }
  return FetchResult::success(std::move(body));
}
