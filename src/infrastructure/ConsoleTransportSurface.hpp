/**
 * @file ConsoleTransportSurface.hpp
 * @brief RemoteTransportSurface for a terminal: prints now-playing lines, turns typed keys into commands.
 */

#pragma once

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

#include "domain/RemoteTransportSurface.hpp"

namespace podscribe::infrastructure {

class ConsoleTransportSurface : public domain::RemoteTransportSurface {
public:
    explicit ConsoleTransportSurface(std::ostream& out);

    void publish(const domain::NowPlayingInfo& info) override;
    void setCommandHandler(CommandHandler handler) override;

    /** @brief Forwards a command to the handler. @return False without a handler or if it refused. */
    bool dispatch(const domain::RemoteCommand& command);

    /**
     * @brief Maps one line of input to a command.
     *
     * "p" toggles, "f"/"b" skip, "g 12:30" (or plain seconds) changes position.
     * @return nullopt for anything else.
     */
    static std::optional<domain::RemoteCommand> ParseCommand(const std::string& line);

    /** @brief Last published snapshot, if any. */
    std::optional<domain::NowPlayingInfo> lastPublished() const;

private:
    std::ostream& m_out;
    mutable std::mutex m_mutex;
    CommandHandler m_handler;
    std::optional<domain::NowPlayingInfo> m_last;
};

} // namespace podscribe::infrastructure
