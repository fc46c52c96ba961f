#pragma once

#include <string>
#include <vector>

namespace quiver::engine::http {

    struct Response {
        long status = 0;
        std::string body;
    };

    /**
     * @brief Blocking JSON POST through libcurl.
     * @throws NetworkError when the transfer itself fails (DNS, connect, timeout).
     */
    Response post_json(const std::string& url, const std::string& body,
                       const std::vector<std::string>& headers, long timeout_secs);

    /**
     * @brief Maps a non-2xx status to the embedding error taxonomy.
     * 401/403 -> AuthFailure, 429 -> RateLimited, anything else -> NetworkError.
     */
    void raise_for_status(const Response& response, const std::string& backend);

}
