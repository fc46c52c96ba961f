#include "http.hpp"
#include "quiver/errors.hpp"
#include <curl/curl.h>

namespace quiver::engine::http {

    namespace {
        size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }

        std::string excerpt(const std::string& body) {
            constexpr size_t kMax = 200;
            return body.size() <= kMax ? body : body.substr(0, kMax) + "...";
        }
    }

    Response post_json(const std::string& url, const std::string& body,
                       const std::vector<std::string>& headers, long timeout_secs) {
        CURL* curl = curl_easy_init();
        if (!curl) throw NetworkError("curl_easy_init failed");

        struct curl_slist* header_list = nullptr;
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
        for (const auto& h : headers) {
            header_list = curl_slist_append(header_list, h.c_str());
        }

        Response response;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_secs);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        }

        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            throw NetworkError(std::string("curl_easy_perform() failed: ") + curl_easy_strerror(res));
        }
        return response;
    }

    void raise_for_status(const Response& response, const std::string& backend) {
        if (response.status >= 200 && response.status < 300) return;

        std::string detail = backend + " HTTP " + std::to_string(response.status) + ": " + excerpt(response.body);
        if (response.status == 401 || response.status == 403) throw AuthFailure(detail);
        if (response.status == 429) throw RateLimited(detail);
        throw NetworkError(detail);
    }

}
