#include <execd/core/http_client.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

#include <curl/curl.h>

namespace execd {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::map<std::string, std::string>* headers =
        static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, size * nitems);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        (*headers)[name] = value;
    }
    return size * nitems;
}

} // anonymous namespace

Json HttpResponse::json() const {
    Json parsed = Json::parse(body, nullptr, false);
    if (parsed.is_discarded()) return Json();
    return parsed;
}

HttpClient::HttpClient()
    : timeout_seconds_(30)
    , connect_timeout_seconds_(10)
{
}

void HttpClient::global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpClient::global_cleanup() {
    curl_global_cleanup();
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& headers) {
    return request("GET", url, "", headers);
}

HttpResponse HttpClient::post_json(const std::string& url, const Json& body,
                                   const std::map<std::string, std::string>& headers) {
    std::map<std::string, std::string> h = headers;
    h["Content-Type"] = "application/json";
    return request("POST", url, json_dump(body), h);
}

HttpResponse HttpClient::del(const std::string& url,
                             const std::map<std::string, std::string>& headers) {
    return request("DELETE", url, "", headers);
}

HttpResponse HttpClient::request(const std::string& method, const std::string& url,
                                 const std::string& body,
                                 const std::map<std::string, std::string>& headers) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    for (std::map<std::string, std::string>::const_iterator it = headers.begin();
         it != headers.end(); ++it) {
        std::string line = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    if (!body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "execd/1.0");

    LOG_DEBUG("[Http] %s %s (body: %zu bytes)", method.c_str(), url.c_str(), body.size());

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        LOG_DEBUG("[Http] %s %s failed: %s", method.c_str(), url.c_str(), response.error.c_str());
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        LOG_DEBUG("[Http] %s %s -> HTTP %ld (%zu bytes)",
                  method.c_str(), url.c_str(), response.status_code, response.body.size());
    }

    if (header_list) curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace execd
