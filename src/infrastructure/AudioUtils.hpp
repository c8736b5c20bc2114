#pragma once

#include <string>
#include <vector>

namespace podscribe::infrastructure {

/**
 * @brief Audio decoding helpers for the recognizer.
 */
class AudioUtils {
public:
    /** @brief Sample rate expected by whisper. */
    static constexpr int kTargetSampleRate = 16000;

    /**
     * @brief Executes a system command.
     */
    static int ExecCmd(const std::string& cmd);

    /**
     * @brief Converts an audio file to 16kHz mono WAV using ffmpeg.
     * @param inputPath Path to source file.
     * @param outputPath Output path, created next to the system temp files.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool ConvertAudioToWav(const std::string& inputPath, std::string& outputPath, std::string& error);

    /**
     * @brief Loads a WAV file and converts it to 16kHz float32 mono.
     * @param fname Path to WAV file.
     * @param pcmf32 Resulting vector of samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error);

    /**
     * @brief Decodes any ffmpeg-readable file to 16kHz float32 mono.
     *
     * Non-WAV input goes through an intermediate WAV that is removed before returning.
     */
    static bool LoadPcm(const std::string& inputPath, std::vector<float>& pcmf32, std::string& error);
};

} // namespace podscribe::infrastructure
