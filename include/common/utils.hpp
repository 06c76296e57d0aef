#pragma once

#include <string>
#include <curl/curl.h>

namespace utils {

inline std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    std::string result(encoded ? encoded : str.c_str());
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

// Percent-encodes every segment of a slash separated path, keeping the slashes.
inline std::string urlEncodePath(const std::string& path) {
    std::string result;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            result += urlEncode(path.substr(start));
            break;
        }
        result += urlEncode(path.substr(start, slash - start)) + "/";
        start = slash + 1;
    }
    return result;
}

} // namespace utils
