#ifndef AUDIOBATCH_MIME_DETECTOR_HPP
#define AUDIOBATCH_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace audiobatch {

    /**
     * @brief File type detection backed by libmagic.
     *
     * Used to annotate failed jobs in the final report: a file named
     * "track.flac" that libmagic calls "text/plain" explains its failure.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return The MIME type (e.g., "audio/flac"), or an empty string if
         * libmagic cannot be loaded or the file cannot be read.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @return true for "audio/..." types, and for the container types
         * libmagic reports for some audio files ("video/mp4", "application/ogg").
         */
        static bool is_audio_mime(const std::string& mime);
    };

} // namespace audiobatch
#endif // AUDIOBATCH_MIME_DETECTOR_HPP
