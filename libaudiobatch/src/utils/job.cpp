#include "../../include/job.hpp"
#include "../../include/file_utils.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace audiobatch {

    std::string normalize_format(const std::string_view format) {
        std::string result = trim_copy(format);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!result.empty() && result.front() != '.') {
            result.insert(result.begin(), '.');
        }
        return result;
    }

    bool is_supported_extension(const std::string_view extension) {
        const std::string ext = normalize_format(extension);
        return std::ranges::find(kSupportedExtensions, ext) != kSupportedExtensions.end();
    }

    ConversionJob make_job(const fs::path& source, const RunConfig& config) {
        const fs::path abs_source = fs::absolute(source).lexically_normal();
        fs::path abs_root = fs::absolute(config.input_dir).lexically_normal();
        if (!abs_root.has_filename() && abs_root != abs_root.root_path()) {
            abs_root = abs_root.parent_path();
        }

        fs::path relative = abs_source.lexically_relative(abs_root);
        if (relative.empty() || *relative.begin() == "..") {
            // not under the root: keep only the file name so the output stays inside output_dir
            relative = abs_source.filename();
        }
        return ConversionJob{abs_source, relative, normalize_format(config.target_format), config.quality};
    }

    fs::path destination_for(const ConversionJob& job, const fs::path& output_dir) {
        fs::path dest = output_dir / job.relative.parent_path() / job.relative.stem();
        dest += job.target_format;
        return dest;
    }

} // namespace audiobatch
