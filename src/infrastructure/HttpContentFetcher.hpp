/**
 * @file HttpContentFetcher.hpp
 * @brief ContentFetcher over cpp-httplib.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/ContentFetcher.hpp"

namespace podscribe::infrastructure {

struct HttpTimeouts {
    int connectSeconds = 15;
    int readSeconds = 60;
};

class HttpContentFetcher : public domain::ContentFetcher {
public:
    explicit HttpContentFetcher(HttpTimeouts timeouts = {});

    void fetchToFile(const std::string& locator,
                     const std::string& destinationPath,
                     ProgressCallback onProgress = nullptr) override;

    /**
     * @brief Splits "scheme://host[:port]/path?query" into the client base and the request path.
     * @return nullopt when the locator has no http(s) scheme or no host.
     */
    static std::optional<std::pair<std::string, std::string>> SplitUrl(const std::string& locator);

private:
    HttpTimeouts m_timeouts;
};

} // namespace podscribe::infrastructure
