#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace verity::engine {

    struct HttpResponse {
        long status = 0;
        std::string body;
        bool aborted = false;   // the data callback asked to stop
    };

    struct HttpOptions {
        std::vector<std::string> headers;
        long timeout_ms = 30000;
        long connect_timeout_ms = 5000;
        const std::atomic<bool>* cancel = nullptr;   // polled while the transfer runs
    };

    /**
     * @brief Receives body bytes as they arrive; return false to abort the transfer.
     */
    using DataCallback = std::function<bool(const char* data, size_t size)>;

    /**
     * @throws verity::Error (Connectivity) when the transfer itself fails.
     */
    HttpResponse http_post_json(const std::string& url, const std::string& json_body, const HttpOptions& options);

    /**
     * @brief POSTs and hands the body to on_data incrementally instead of buffering it.
     * The returned body is only filled for non-2xx responses.
     */
    HttpResponse http_post_stream(const std::string& url, const std::string& json_body,
                                  const HttpOptions& options, const DataCallback& on_data);

    bool is_success(const HttpResponse& response);

    /**
     * @brief "status 500: <first 200 bytes of body>" for error messages.
     */
    std::string describe(const HttpResponse& response);

}
