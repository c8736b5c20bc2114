/**
 * @file HttpContentFetcher.cpp
 * @brief Implementation of HttpContentFetcher.
 */

#include "infrastructure/HttpContentFetcher.hpp"
#include "domain/Errors.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace podscribe::infrastructure {

using domain::CoreError;
using domain::ErrorKind;

HttpContentFetcher::HttpContentFetcher(HttpTimeouts timeouts)
    : m_timeouts(timeouts) {}

std::optional<std::pair<std::string, std::string>> HttpContentFetcher::SplitUrl(const std::string& locator) {
    const auto schemeEnd = locator.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    std::string scheme = locator.substr(0, schemeEnd);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    const auto hostStart = schemeEnd + 3;
    const auto pathStart = locator.find_first_of("/?", hostStart);
    std::string host = pathStart == std::string::npos
        ? locator.substr(hostStart)
        : locator.substr(hostStart, pathStart - hostStart);
    if (host.empty()) {
        return std::nullopt;
    }

    std::string path = pathStart == std::string::npos ? "/" : locator.substr(pathStart);
    if (path.front() == '?') {
        path.insert(path.begin(), '/');
    }
    return std::make_pair(scheme + "://" + host, path);
}

void HttpContentFetcher::fetchToFile(const std::string& locator,
                                     const std::string& destinationPath,
                                     ProgressCallback onProgress) {
    auto parts = SplitUrl(locator);
    if (!parts) {
        throw CoreError(ErrorKind::DownloadFailed, "Unsupported locator: " + locator);
    }

    httplib::Client cli(parts->first);
    if (!cli.is_valid()) {
        throw CoreError(ErrorKind::DownloadFailed, "Cannot open a client for " + parts->first);
    }
    cli.set_follow_location(true);
    cli.set_connection_timeout(m_timeouts.connectSeconds, 0);
    cli.set_read_timeout(m_timeouts.readSeconds, 0);

    std::ofstream out(destinationPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw CoreError(ErrorKind::DownloadFailed, "Cannot write " + destinationPath);
    }

    int status = 0;
    std::uint64_t total = 0;
    std::uint64_t received = 0;
    bool aborted = false;
    bool writeFailed = false;

    auto res = cli.Get(parts->second, httplib::Headers{},
        [&](const httplib::Response& response) {
            status = response.status;
            if (response.has_header("Content-Length")) {
                try {
                    total = std::stoull(response.get_header_value("Content-Length"));
                } catch (const std::exception&) {
                    total = 0;
                }
            }
            return response.status == 200;
        },
        [&](const char* data, size_t length) {
            out.write(data, static_cast<std::streamsize>(length));
            if (!out) {
                writeFailed = true;
                return false;
            }
            received += length;
            if (onProgress && !onProgress(received, total)) {
                aborted = true;
                return false;
            }
            return true;
        });
    out.close();

    auto discard = [&destinationPath]() {
        std::error_code ec;
        std::filesystem::remove(destinationPath, ec);
    };

    if (aborted) {
        discard();
        throw CoreError(ErrorKind::DownloadFailed, "Download aborted");
    }
    if (writeFailed) {
        discard();
        throw CoreError(ErrorKind::DownloadFailed, "Write failed for " + destinationPath);
    }
    if (status != 0 && status != 200) {
        discard();
        throw CoreError(ErrorKind::DownloadFailed, "HTTP status " + std::to_string(status) + " for " + locator);
    }
    if (!res) {
        discard();
        throw CoreError(ErrorKind::DownloadFailed, "Connection failed: " + httplib::to_string(res.error()));
    }

    std::cout << "[HttpContentFetcher] Fetched " << received << " bytes from " << locator << std::endl;
}

} // namespace podscribe::infrastructure
