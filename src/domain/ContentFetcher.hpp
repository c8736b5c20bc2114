/**
 * @file ContentFetcher.hpp
 * @brief Interface for downloading remote content to local storage.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace podscribe::domain {

class ContentFetcher {
public:
    virtual ~ContentFetcher() = default;

    /** @brief Return false to abort the transfer. */
    using ProgressCallback = std::function<bool(std::uint64_t received, std::uint64_t total)>;

    /**
     * @brief Downloads the full payload behind a locator.
     * @param locator Remote address.
     * @param destinationPath Local file to create or overwrite.
     * @param onProgress Optional; total is 0 when the server does not announce a length.
     * @throws CoreError (DownloadFailed) on any transport or status failure, or when aborted.
     */
    virtual void fetchToFile(const std::string& locator,
                             const std::string& destinationPath,
                             ProgressCallback onProgress = nullptr) = 0;
};

} // namespace podscribe::domain
