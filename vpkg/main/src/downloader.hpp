#pragma once

#include <filesystem>
#include <string>
#include <string_view>

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Fetches a small resource into memory. Transport failures throw VpkgException(Network);
// HTTP error statuses are returned to the caller.
HttpResponse http_get(const std::string& url, long timeout_seconds);

// Streams url to output_path chunk by chunk. The transfer may take as long as it needs
// but is aborted once no data arrives for stall_timeout_seconds. Any transport failure
// or HTTP error status throws VpkgException(Network); the partial file is left for the caller.
void download_file(const std::string& url, const std::filesystem::path& output_path, long stall_timeout_seconds, bool show_progress = true);

std::string url_encode(std::string_view value);
