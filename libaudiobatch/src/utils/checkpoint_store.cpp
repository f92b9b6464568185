#include "../../include/checkpoint_store.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace audiobatch {

    namespace {
        json to_json(const Checkpoint& cp) {
            json remaining = json::array();
            for (const auto& p : cp.remaining_files) {
                remaining.push_back(p.string());
            }
            return json{
                {"inputDir", cp.input_dir.string()},
                {"outputDir", cp.output_dir.string()},
                {"targetFormat", cp.target_format},
                {"quality", cp.quality},
                {"cores", cp.cores},
                {"totalFiles", cp.total_files},
                {"remainingFiles", std::move(remaining)}
            };
        }

        Checkpoint from_json(const json& j) {
            Checkpoint cp;
            cp.input_dir = j.at("inputDir").get<std::string>();
            cp.output_dir = j.at("outputDir").get<std::string>();
            cp.target_format = j.at("targetFormat").get<std::string>();
            cp.quality = j.at("quality").get<int>();
            // negative or oversized counts become 0 / UINT_MAX, never a wrapped value
            const auto cores = j.at("cores").get<long long>();
            cp.cores = static_cast<unsigned>(std::clamp<long long>(cores, 0, std::numeric_limits<unsigned>::max()));
            cp.total_files = j.at("totalFiles").get<std::size_t>();
            for (const auto& entry : j.at("remainingFiles")) {
                cp.remaining_files.emplace_back(entry.get<std::string>());
            }
            return cp;
        }
    } // namespace

    CheckpointStore::CheckpointStore(fs::path path) : path_(std::move(path)) {}

    void CheckpointStore::save(const Checkpoint& checkpoint) const {
        std::string text;
        try {
            text = to_json(checkpoint).dump(2);
        } catch (const json::exception& e) {
            throw CheckpointError(std::string("cannot encode checkpoint (") + e.what() + ")", path_);
        }
        text.push_back('\n');

        try {
            write_file_atomically(path_, text);
        } catch (const std::system_error& e) {
            throw CheckpointError(std::string("cannot write checkpoint (") + e.what() + ")", path_);
        }
        Logger::log(LogLevel::Info,
                    "Checkpoint saved: " + std::to_string(checkpoint.remaining_files.size()) + " of " +
                    std::to_string(checkpoint.total_files) + " files remaining",
                    "checkpoint");
    }

    std::optional<Checkpoint> CheckpointStore::load() const {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            if (ec) {
                throw CheckpointError("cannot access checkpoint (" + ec.message() + ")", path_);
            }
            return std::nullopt;
        }

        std::string text;
        try {
            text = read_file(path_);
        } catch (const std::system_error& e) {
            throw CheckpointError(std::string("cannot read checkpoint (") + e.what() + ")", path_);
        }

        try {
            auto cp = from_json(json::parse(text));
            Logger::log(LogLevel::Debug, "Checkpoint loaded from " + path_.string(), "checkpoint");
            return cp;
        } catch (const json::exception& e) {
            throw CheckpointError(std::string("malformed checkpoint (") + e.what() + ")", path_);
        }
    }

    void CheckpointStore::remove() const {
        std::error_code ec;
        const bool removed = fs::remove(path_, ec);
        if (ec) {
            throw CheckpointError("cannot delete checkpoint (" + ec.message() + ")", path_);
        }
        if (removed) {
            Logger::log(LogLevel::Info, "Checkpoint deleted: " + path_.string(), "checkpoint");
        }
    }

    bool CheckpointStore::exists() const {
        std::error_code ec;
        return fs::is_regular_file(path_, ec);
    }

    fs::path CheckpointStore::default_path() {
        const char* home = std::getenv("HOME");
        if (!home || *home == '\0') {
            return fs::path("checkpoint.json");
        }
        return fs::path(home) / ".local/share/audiobatch/checkpoint.json";
    }

} // namespace audiobatch
