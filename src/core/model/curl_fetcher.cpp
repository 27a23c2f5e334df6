#include "curl_fetcher.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <fstream>

namespace {

struct Transfer {
    std::ofstream out;
    FetchInfo info;
    const FetchProgress* progress = nullptr;
    bool cancelled = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    t->out.write(ptr, static_cast<std::streamsize>(size * nmemb));
    if (!t->out) return 0; // makes curl fail with CURLE_WRITE_ERROR
    t->info.bytes += size * nmemb;
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    CurlFetcher::parse_header_line(std::string_view(buffer, size * nitems), t->info);
    return size * nitems;
}

int xferinfo_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* t = static_cast<Transfer*>(userdata);
    if (t->progress && *t->progress) {
        if (!(*t->progress)(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal))) {
            t->cancelled = true;
            return 1;
        }
    }
    return 0;
}

std::string unquote_etag(std::string_view v) {
    if (v.starts_with("W/")) v.remove_prefix(2);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        v = v.substr(1, v.size() - 2);
    }
    return std::string(v);
}

} // namespace

CurlFetcher::CurlFetcher() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlFetcher::~CurlFetcher() {
    curl_global_cleanup();
}

void CurlFetcher::parse_header_line(std::string_view line, FetchInfo& info) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos) return;

    std::string name(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto value = line.substr(colon + 1);
    auto start = value.find_first_not_of(" \t\r\n");
    auto end = value.find_last_not_of(" \t\r\n");
    if (start == std::string_view::npos) return;
    value = value.substr(start, end - start + 1);

    // Redirect responses from the hub carry the blob hash as x-linked-etag;
    // the CDN answer that follows has its own etag, which must not win.
    if (name == "x-repo-commit") {
        if (info.commit.empty()) info.commit = std::string(value);
    } else if (name == "x-linked-etag") {
        info.etag = unquote_etag(value);
    } else if (name == "etag") {
        if (info.etag.empty()) info.etag = unquote_etag(value);
    }
}

std::expected<FetchInfo, std::string>
CurlFetcher::fetch(const std::string& url, const std::filesystem::path& dest,
                   const FetchProgress& progress) {
    Transfer transfer;
    transfer.progress = &progress;
    transfer.out.open(dest, std::ios::binary | std::ios::trunc);
    if (!transfer.out.is_open()) {
        return std::unexpected("cannot write " + dest.string());
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "whisperdesk");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    // Abort when the transfer stalls below 1 KiB/s for a minute.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    transfer.out.close();

    if (transfer.cancelled) {
        return std::unexpected("download cancelled");
    }
    if (res != CURLE_OK) {
        std::string msg = errbuf[0] ? errbuf : curl_easy_strerror(res);
        return std::unexpected("download failed: " + msg);
    }
    if (!transfer.out) {
        return std::unexpected("write error on " + dest.string());
    }

    return transfer.info;
}
