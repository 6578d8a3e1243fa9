#include "http.hpp"
#include "verity/error.hpp"
#include <curl/curl.h>
#include <mutex>

namespace verity::engine {

    namespace {

        void ensure_global_init() {
            static std::once_flag once;
            std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        }

        struct CurlHandle {
            CURL* h = nullptr;
            curl_slist* headers = nullptr;

            CurlHandle() {
                ensure_global_init();
                h = curl_easy_init();
                if (!h) throw Error(ErrorKind::Connectivity, "curl_easy_init failed");
            }
            ~CurlHandle() {
                if (headers) curl_slist_free_all(headers);
                if (h) curl_easy_cleanup(h);
            }
            CurlHandle(const CurlHandle&) = delete;
            CurlHandle& operator=(const CurlHandle&) = delete;
        };

        size_t buffer_cb(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }

        struct StreamState {
            CURL* h;
            const DataCallback* on_data;
            std::string error_body;
            bool aborted = false;
        };

        size_t stream_cb(void* contents, size_t size, size_t nmemb, void* userp) {
            auto* state = static_cast<StreamState*>(userp);
            size_t total = size * nmemb;
            long status = 0;
            curl_easy_getinfo(state->h, CURLINFO_RESPONSE_CODE, &status);
            if (status < 200 || status >= 300) {
                state->error_body.append(static_cast<char*>(contents), total);
                return total;
            }
            if (!(*state->on_data)(static_cast<const char*>(contents), total)) {
                state->aborted = true;
                return 0; // makes curl stop with CURLE_WRITE_ERROR
            }
            return total;
        }

        int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
            const auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
            return cancel->load() ? 1 : 0;
        }

        void configure(CurlHandle& c, const std::string& url, const HttpOptions& options, bool json) {
            if (json) c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
            for (const auto& h : options.headers) c.headers = curl_slist_append(c.headers, h.c_str());

            curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
            curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, options.timeout_ms);
            curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT_MS, options.connect_timeout_ms);
            curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
            if (options.cancel) {
                curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
                curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(options.cancel));
                curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
            }
        }

        HttpResponse perform(CurlHandle& c, const std::string& url, std::string& buf) {
            CURLcode code = curl_easy_perform(c.h);
            if (code != CURLE_OK) {
                throw Error(ErrorKind::Connectivity,
                            "request to " + url + " failed: " + curl_easy_strerror(code));
            }
            HttpResponse resp;
            curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
            resp.body = std::move(buf);
            return resp;
        }

    }

    HttpResponse http_post_json(const std::string& url, const std::string& json_body, const HttpOptions& options) {
        CurlHandle c;
        configure(c, url, options, true);
        std::string buf;
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
        curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, buffer_cb);
        curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
        return perform(c, url, buf);
    }

    HttpResponse http_post_stream(const std::string& url, const std::string& json_body,
                                  const HttpOptions& options, const DataCallback& on_data) {
        CurlHandle c;
        configure(c, url, options, true);
        StreamState state{c.h, &on_data, {}, false};
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
        curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, stream_cb);
        curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &state);

        CURLcode code = curl_easy_perform(c.h);
        HttpResponse resp;
        curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
        if (state.aborted || (code == CURLE_ABORTED_BY_CALLBACK && options.cancel && options.cancel->load())) {
            resp.aborted = true;
            return resp;
        }
        if (code != CURLE_OK) {
            throw Error(ErrorKind::Connectivity,
                        "request to " + url + " failed: " + curl_easy_strerror(code));
        }
        resp.body = std::move(state.error_body);
        return resp;
    }

    bool is_success(const HttpResponse& response) {
        return response.status >= 200 && response.status < 300;
    }

    std::string describe(const HttpResponse& response) {
        std::string excerpt = response.body.substr(0, 200);
        return "status " + std::to_string(response.status) + (excerpt.empty() ? "" : ": " + excerpt);
    }

}
