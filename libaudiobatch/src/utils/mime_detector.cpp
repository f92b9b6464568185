#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <string>

std::string audiobatch::MimeDetector::detect(const std::filesystem::path& path)
{
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

bool audiobatch::MimeDetector::is_audio_mime(const std::string& mime)
{
    return mime.starts_with("audio/") ||
           mime == "video/mp4" ||
           mime == "application/ogg";
}
