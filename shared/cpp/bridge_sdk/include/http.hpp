#pragma once
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

using HttpHeaders = std::vector<std::string>; // "Name: value"

// Both throw HttpError when the request could not be performed at all
// (refused, timed out, ...). Any HTTP status is returned as-is.
HttpResponse http_get(const std::string& url, const HttpHeaders& headers = {}, long timeout_ms = 3000);
HttpResponse http_post_json(const std::string& url, const std::string& json_body,
                            const HttpHeaders& headers = {}, long timeout_ms = 30000);
