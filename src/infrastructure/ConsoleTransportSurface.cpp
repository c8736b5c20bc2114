#include "infrastructure/ConsoleTransportSurface.hpp"
#include "domain/TimecodeParser.hpp"

#include <ostream>
#include <string>

namespace podscribe::infrastructure {

using domain::RemoteCommand;

ConsoleTransportSurface::ConsoleTransportSurface(std::ostream& out)
    : m_out(out) {}

void ConsoleTransportSurface::publish(const domain::NowPlayingInfo& info) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last = info;
    m_out << "[NowPlaying] " << (info.rate > 0.0 ? "> " : "|| ") << info.title << "  "
          << domain::FormatClock(info.elapsed) << " / " << domain::FormatClock(info.duration) << std::endl;
}

void ConsoleTransportSurface::setCommandHandler(CommandHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handler = std::move(handler);
}

bool ConsoleTransportSurface::dispatch(const RemoteCommand& command) {
    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_handler;
    }
    // Called unlocked: the handler publishes back into this surface.
    return handler ? handler(command) : false;
}

std::optional<RemoteCommand> ConsoleTransportSurface::ParseCommand(const std::string& line) {
    if (line.empty()) return std::nullopt;

    RemoteCommand command;
    switch (line[0]) {
        case 'p': command.type = RemoteCommand::Type::TogglePlayPause; return command;
        case 'f': command.type = RemoteCommand::Type::SkipForward; return command;
        case 'b': command.type = RemoteCommand::Type::SkipBackward; return command;
        case 'g': break;
        default: return std::nullopt;
    }

    const auto argStart = line.find_first_not_of(' ', 1);
    if (argStart == std::string::npos) return std::nullopt;
    const std::string arg = line.substr(argStart);

    if (auto seconds = domain::TimecodeParser::ToSeconds(arg)) {
        command.positionSeconds = *seconds;
    } else {
        try {
            size_t used = 0;
            command.positionSeconds = std::stod(arg, &used);
            if (used != arg.size()) return std::nullopt;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    command.type = RemoteCommand::Type::ChangePlaybackPosition;
    return command;
}

std::optional<domain::NowPlayingInfo> ConsoleTransportSurface::lastPublished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last;
}

} // namespace podscribe::infrastructure
