#include "../include/http.hpp"
#include "../include/errors.hpp"
#include <curl/curl.h>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw HttpError("curl_easy_init failed", 0); }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

HttpResponse perform(CurlHandle& c, const std::string& url, long timeout_ms) {
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOPROXY, "*");

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw HttpError(std::string("request to ") + url + " failed: " + curl_easy_strerror(code), 0);
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}
}

HttpResponse http_get(const std::string& url, const HttpHeaders& headers, long timeout_ms) {
    CurlHandle c;
    for (const auto& h : headers) c.headers = curl_slist_append(c.headers, h.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPGET, 1L);
    return perform(c, url, timeout_ms);
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body,
                            const HttpHeaders& headers, long timeout_ms) {
    CurlHandle c;
    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    for (const auto& h : headers) c.headers = curl_slist_append(c.headers, h.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    return perform(c, url, timeout_ms);
}
