// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/remote/curl_executor.hpp>
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>

namespace tandem::remote {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr) { other.ptr = nullptr; }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }
};

struct FileCloser {
    void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

// Header callback: lower-cased name -> value
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// Discard callback for body-less requests
std::size_t discard_callback(char*, std::size_t size, std::size_t nitems, void*) {
    return size * nitems;
}

// Destination for one range
struct RangeSink {
    std::FILE* file{nullptr};
    std::uint64_t written{0};
    std::uint64_t limit{0};
    bool overflow{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* sink = static_cast<RangeSink*>(userdata);
    std::size_t bytes = size * nmemb;

    // Server ignored the Range header and is sending the whole file
    if (sink->written + bytes > sink->limit) {
        sink->overflow = true;
        return 0;
    }

    if (std::fwrite(ptr, 1, bytes, sink->file) != bytes) {
        return 0;
    }
    sink->written += bytes;
    return bytes;
}

bool is_unreserved(unsigned char c) noexcept {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
}

void apply_common_options(CURL* curl, const CurlExecutor::Options& opts) {
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(core::MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(opts.low_speed_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

RemoteFailure failure(core::TransferErrc code, std::string detail) {
    return RemoteFailure{make_error_code(code), std::move(detail)};
}

std::string describe(CURLcode result, const char* errbuf) {
    if (errbuf && errbuf[0] != '\0') {
        return errbuf;
    }
    return curl_easy_strerror(result);
}

} // namespace

//=============================================================================
// CurlExecutor
//=============================================================================

CurlExecutor::CurlExecutor(Options options)
    : options_(std::move(options)) {}

std::string CurlExecutor::url_for(std::string_view remote_path) const {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(remote_path.size());
    for (char ch : remote_path) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            encoded += ch;
        } else {
            encoded += '%';
            encoded += HEX[c >> 4];
            encoded += HEX[c & 0x0F];
        }
    }

    std::string url = options_.base_url;
    bool base_slash = !url.empty() && url.back() == '/';
    bool path_slash = !encoded.empty() && encoded.front() == '/';

    if (url.ends_with("://")) {
        url += encoded;
    } else if (base_slash && path_slash) {
        url += encoded.substr(1);
    } else if (!base_slash && !path_slash && !encoded.empty()) {
        url += '/';
        url += encoded;
    } else {
        url += encoded;
    }
    return url;
}

SizeResult CurlExecutor::stat_size(std::string_view remote_path) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(failure(core::TransferErrc::remote_error, "curl_easy_init failed"));
    }

    std::string url = url_for(remote_path);
    std::map<std::string, std::string> headers;
    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    // file:// only reports its size when headers are requested
    curl_easy_setopt(curl.ptr, CURLOPT_HEADER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, reinterpret_cast<void*>(discard_callback));
    curl_easy_setopt(curl.ptr, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, reinterpret_cast<void*>(header_callback));
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &headers);
    apply_common_options(curl.ptr, options_);

    spdlog::debug("Stat {}", url);
    CURLcode result = curl_easy_perform(curl.ptr);

    if (result == CURLE_FILE_COULDNT_READ_FILE || result == CURLE_REMOTE_FILE_NOT_FOUND) {
        return std::unexpected(failure(core::TransferErrc::remote_not_found, describe(result, errbuf)));
    }
    if (result != CURLE_OK) {
        spdlog::warn("Stat {} failed: {}", url, describe(result, errbuf));
        return std::unexpected(failure(core::TransferErrc::remote_error, describe(result, errbuf)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code == 404 || http_code == 410) {
        return std::unexpected(failure(core::TransferErrc::remote_not_found,
                                       "HTTP " + std::to_string(http_code)));
    }
    if (http_code >= 400) {
        return std::unexpected(failure(core::TransferErrc::remote_error,
                                       "HTTP " + std::to_string(http_code)));
    }

    curl_off_t cl = -1;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
        return static_cast<std::uint64_t>(cl);
    }

    // Some servers only answer HEAD with a header curl does not fold into the info
    auto cl_it = headers.find("content-length");
    if (cl_it != headers.end() && !cl_it->second.empty()) {
        char* end = nullptr;
        unsigned long long val = std::strtoull(cl_it->second.c_str(), &end, 10);
        if (end == cl_it->second.c_str() + cl_it->second.size()) {
            return static_cast<std::uint64_t>(val);
        }
    }

    return std::unexpected(failure(core::TransferErrc::remote_error, "size not reported by " + url));
}

ReadResult CurlExecutor::range_read(std::string_view remote_path,
                                    std::uint64_t offset,
                                    std::uint64_t length,
                                    const std::filesystem::path& dest) {
    if (length == 0) {
        return std::unexpected(failure(core::TransferErrc::invalid_size, "empty range"));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(failure(core::TransferErrc::remote_error, "curl_easy_init failed"));
    }

    FilePtr file(std::fopen(dest.c_str(), "wb"));
    if (!file) {
        return std::unexpected(failure(core::TransferErrc::remote_error,
                                       "cannot create " + dest.string()));
    }

    std::string url = url_for(remote_path);
    std::string range = std::to_string(offset) + "-" + std::to_string(offset + length - 1);
    RangeSink sink{file.get(), 0, length, false};
    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, reinterpret_cast<void*>(write_callback));
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(core::WRITE_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);
    apply_common_options(curl.ptr, options_);

    spdlog::debug("GET {} range {}", url, range);
    CURLcode result = curl_easy_perform(curl.ptr);

    bool flushed = std::fflush(file.get()) == 0;
    file.reset();

    std::error_code rm_ec;
    if (sink.overflow) {
        std::filesystem::remove(dest, rm_ec);
        return std::unexpected(failure(core::TransferErrc::short_read,
                                       "server ignored range " + range));
    }
    if (result != CURLE_OK) {
        std::filesystem::remove(dest, rm_ec);
        auto code = (result == CURLE_FILE_COULDNT_READ_FILE || result == CURLE_REMOTE_FILE_NOT_FOUND)
            ? core::TransferErrc::remote_not_found
            : core::TransferErrc::remote_error;
        return std::unexpected(failure(code, describe(result, errbuf)));
    }
    if (!flushed) {
        std::filesystem::remove(dest, rm_ec);
        return std::unexpected(failure(core::TransferErrc::remote_error,
                                       "write to " + dest.string() + " failed"));
    }

    return verify_length(dest, length);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlExecutor::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlExecutor::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace tandem::remote
