#include "taxonomy/taxonomy_fetcher.hpp"
#include "util/file_util.hpp"

#include <cstdio>

#ifdef KUBUILD_ENABLE_REMOTE
#include <chrono>
#include <thread>
#include <curl/curl.h>

#include "core/version.hpp"
#endif

namespace kubuild {

std::string names_dmp_path(const std::string& taxonomy_dir) {
    return path_join(taxonomy_dir, "names.dmp");
}

std::string nodes_dmp_path(const std::string& taxonomy_dir) {
    return path_join(taxonomy_dir, "nodes.dmp");
}

bool taxonomy_dumps_present(const std::string& taxonomy_dir) {
    return file_exists(names_dmp_path(taxonomy_dir)) &&
           file_exists(nodes_dmp_path(taxonomy_dir));
}

#ifdef KUBUILD_ENABLE_REMOTE

bool remote_fetch_enabled() { return true; }

// libcurl write callback
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* fp = static_cast<FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, fp) * size;
}

static bool is_retryable_curl_code(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return true;
        default:
            return false;
    }
}

bool download_file(const std::string& url, const std::string& dest,
                   const FetchOptions& opts, std::string& error) {
    static const bool curl_ready = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
    if (!curl_ready) {
        error = "curl_global_init failed";
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "curl_easy_init failed";
        return false;
    }

    std::string tmp = dest + ".tmp";
    uint32_t backoff_ms = 1000;
    bool ok = false;

    for (uint32_t attempt = 0; attempt <= opts.retries; attempt++) {
        FILE* fp = std::fopen(tmp.c_str(), "wb");
        if (!fp) {
            error = "cannot open '" + tmp + "' for writing";
            break;
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, fp);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(opts.connect_timeout_sec));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(opts.timeout_sec));
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "kubuild/" KUBUILD_VERSION);

        CURLcode res = curl_easy_perform(curl);
        bool closed = (std::fclose(fp) == 0);

        if (res == CURLE_OK && closed) {
            ok = true;
            break;
        }

        error = (res != CURLE_OK) ? curl_easy_strerror(res) : "write error";
        if (res != CURLE_OK && is_retryable_curl_code(res) && attempt < opts.retries) {
            std::fprintf(stderr, "fetch: %s, retrying in %u ms (attempt %u/%u)\n",
                         error.c_str(), backoff_ms, attempt + 1, opts.retries);
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms *= 2;
            continue;
        }
        break;
    }

    curl_easy_cleanup(curl);

    if (!ok) {
        remove_file(tmp);
        return false;
    }
    if (!rename_file(tmp, dest)) {
        error = "cannot rename '" + tmp + "' to '" + dest + "'";
        return false;
    }
    return true;
}

#else

bool remote_fetch_enabled() { return false; }

bool download_file(const std::string& url, const std::string& /*dest*/,
                   const FetchOptions& /*opts*/, std::string& error) {
    error = "cannot download " + url + ": built without KUBUILD_ENABLE_REMOTE";
    return false;
}

#endif // KUBUILD_ENABLE_REMOTE

} // namespace kubuild
