#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cctype>
#include <cerrno>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;

    fs::path normalized_absolute(const fs::path& p) {
        fs::path n = fs::absolute(p).lexically_normal();
        if (!n.has_filename() && n != n.root_path()) {
            n = n.parent_path();
        }
        return n;
    }
}

namespace audiobatch {

    bool ensure_directory(const fs::path& dir, std::error_code& ec) {
        ec.clear();
        if (dir.empty()) {
            return true;
        }
        fs::create_directories(dir, ec);
        if (!ec) {
            return true;
        }
        // another worker may have created it between our check and mkdir
        std::error_code probe;
        if (fs::is_directory(dir, probe)) {
            ec.clear();
            return true;
        }
        Logger::log(LogLevel::Debug, "Failed to create directory " + dir.string() + " (" + ec.message() + ")", "file_utils");
        return false;
    }

    void write_file_atomically(const fs::path& path, const std::string_view contents) {
        std::error_code ec;
        if (!ensure_directory(path.parent_path(), ec)) {
            throw std::system_error(ec, "cannot create directory for " + path.string());
        }

        fs::path tmp = path;
        tmp += ".tmp." + random_suffix();

        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::system_error(errno ? errno : EIO, std::generic_category(),
                                        "cannot open " + tmp.string());
            }
            out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
            out.flush();
            if (!out) {
                out.close();
                fs::remove(tmp, ec);
                throw std::system_error(EIO, std::generic_category(), "short write to " + tmp.string());
            }
        }

        fs::rename(tmp, path, ec);
        if (ec) {
            const std::error_code rename_ec = ec;
            fs::remove(tmp, ec);
            throw std::system_error(rename_ec, "cannot replace " + path.string());
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::system_error(errno ? errno : ENOENT, std::generic_category(),
                                    "cannot open " + path.string());
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            throw std::system_error(EIO, std::generic_category(), "cannot read " + path.string());
        }
        return buffer.str();
    }

    std::string trim_copy(const std::string_view text) {
        std::size_t start = 0;
        while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
            ++start;
        }
        std::size_t end = text.size();
        while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
            --end;
        }
        return std::string(text.substr(start, end - start));
    }

    std::string random_suffix() {
        return std::to_string(dist(rng));
    }

    bool is_within(const fs::path& path, const fs::path& root) {
        const fs::path rel = normalized_absolute(path).lexically_relative(normalized_absolute(root));
        if (rel.empty()) {
            return false;
        }
        const auto first = *rel.begin();
        return first != ".." && first != ".";
    }

} // namespace audiobatch
