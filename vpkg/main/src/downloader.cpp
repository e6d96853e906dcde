#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {

// HTTP download callback function
size_t write_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::ostream* out = static_cast<std::ostream*>(stream);
    size_t bytes = size * nmemb;
    out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    return out->good() ? bytes : 0;
}

size_t write_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    out->append(static_cast<char*>(ptr), bytes);
    return bytes;
}

// Download progress bar callback
int progress_callback([[maybe_unused]] void* clientp, curl_off_t dltotal, curl_off_t dlnow, [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
    if (dltotal <= 0) {
        return 0;
    }
    double percentage = static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0;
    log_progress(get_string("info.downloading"), percentage);
    return 0;
}

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle make_handle(const std::string& url, long connect_timeout_seconds) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw VpkgException(ErrorKind::Network, string_format("error.curl_init_failed", url));
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, std::min(connect_timeout_seconds, 10L));
    return curl;
}

} // anonymous namespace

HttpResponse http_get(const std::string& url, long timeout_seconds) {
    CurlHandle curl = make_handle(url, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_FILE_COULDNT_READ_FILE) {
        // file:// resource that does not exist
        response.status = 404;
        response.body.clear();
        return response;
    }
    if (res != CURLE_OK) {
        throw VpkgException(ErrorKind::Network, string_format("error.request_failed", url, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status == 0) {
        // Non-HTTP schemes report no status code
        response.status = 200;
    }
    return response;
}

void download_file(const std::string& url, const std::filesystem::path& output_path, long stall_timeout_seconds, bool show_progress) {
    CurlHandle curl = make_handle(url, stall_timeout_seconds);
    // No limit on the whole transfer; abort only when it stops making progress
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, stall_timeout_seconds);

    std::ofstream ofile(output_path, std::ios::binary | std::ios::trunc);
    if (!ofile) {
        throw VpkgException(ErrorKind::Io, string_format("error.create_file_failed", output_path.string()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofile);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

    if (show_progress) {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (show_progress && isatty(STDOUT_FILENO)) {
        std::cout << std::endl;
    }

    if (res != CURLE_OK) {
        throw VpkgException(ErrorKind::Network, string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }

    ofile.flush();
    if (!ofile) {
        throw VpkgException(ErrorKind::Io, string_format("error.write_file_failed", output_path.string()));
    }
}

std::string url_encode(std::string_view value) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw VpkgException(ErrorKind::Network, string_format("error.curl_init_failed", std::string(value)));
    }
    char* escaped = curl_easy_escape(curl.get(), value.data(), static_cast<int>(value.size()));
    if (!escaped) {
        return std::string(value);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}
