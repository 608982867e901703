#pragma once

#include <string>

// Hash that apk puts into the file names of its cached indexes, the
// "12345678" in "APKINDEX.12345678.tar.gz". Derived from the SHA-1 of the
// repository URL.
// Throws ApkmetaException if OpenSSL fails.
std::string apk_repo_hash(const std::string& url, size_t length = 8);
