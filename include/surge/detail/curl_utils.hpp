#pragma once

#include <string>

namespace surge::detail {

void ensureCurlInitialized();

// True if libcurl accepts the string as an absolute URL with a supported scheme.
[[nodiscard]] bool isWellFormedUrl(const std::string& url);

// Last path segment, URL-decoded. Empty when the path ends with '/'.
[[nodiscard]] std::string fileNameFromUrl(const std::string& url);

} // namespace surge::detail
