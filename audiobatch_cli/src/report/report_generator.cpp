#include "report_generator.hpp"
#include "progress_reporter.hpp"
#include "../utils/color.hpp"
#include "../../../libaudiobatch/include/logger.hpp"
#include "../../../libaudiobatch/include/mime_detector.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>

#include <sys/ioctl.h>
#include <unistd.h>

using namespace audiobatch;

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::vector<FailureRow> build_failure_rows(const std::vector<FailureRecord>& failures) {
    std::vector<FailureRow> rows;
    rows.reserve(failures.size());
    for (const auto& f : failures) {
        rows.push_back(FailureRow{f.path, MimeDetector::detect(f.path), f.message});
    }
    std::ranges::sort(rows, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });
    return rows;
}

void print_console_report(std::ostream& out,
                          const SessionResult& result,
                          const std::vector<FailureRow>& failures,
                          const bool use_colors) {
    auto paint = [use_colors](const char* color) { return use_colors ? color : ""; };

    if (result.phase == RunPhase::Cancelled) {
        out << "\n" << paint(YELLOW) << "Stopped, progress saved" << paint(RESET) << "\n";
        return;
    }

    if (!failures.empty()) {
        size_t max_name = 4;
        size_t max_mime = 9;
        for (const auto& r : failures) {
            max_name = std::max(max_name, r.path.filename().string().size());
            max_mime = std::max(max_mime, r.mime.size());
        }
        const unsigned term_width = get_terminal_width();
        max_name = std::min<size_t>(max_name, std::max(8u, term_width / 2));

        auto truncate = [](const std::string& s, const size_t max_len) {
            return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
        };

        out << "\n" << paint(RED) << "Some files failed:" << paint(RESET) << "\n";
        out << std::left << std::setw(static_cast<int>(max_name + 2)) << "File"
            << std::setw(static_cast<int>(max_mime + 2)) << "MIME type"
            << "Error\n";
        for (const auto& r : failures) {
            out << std::left << std::setw(static_cast<int>(max_name + 2))
                << truncate(r.path.filename().string(), max_name)
                << std::setw(static_cast<int>(max_mime + 2)) << (r.mime.empty() ? "-" : r.mime)
                << paint(RED) << r.error_msg << paint(RESET) << "\n";
        }
    }

    const auto failed = failures.size();
    const auto converted = result.completed >= failed ? result.completed - failed : 0;
    out << "\n" << paint(GREEN) << "DONE" << paint(RESET) << "\n"
        << "Converted: " << converted << ", failed: " << failed << ", total: " << result.total << "\n"
        << "Total time: " << format_duration(result.elapsed)
        << " (" << result.config.concurrency << " core" << (result.config.concurrency > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const SessionResult& result,
                       const std::vector<FailureRow>& failures,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report " + output_path.string(), "main");
        return false;
    }

    out << "File,MIME,Error\n";
    for (const auto& r : failures) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.mime) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nResult,Completed,Failed,Total,Remaining,Time(s),Format,Cores\n";
    out << phase_to_string(result.phase) << ","
        << result.completed << ","
        << failures.size() << ","
        << result.total << ","
        << result.remaining << ","
        << std::fixed << std::setprecision(2)
        << static_cast<double>(result.elapsed.count()) / 1000.0 << ","
        << csv_escape(result.config.target_format) << ","
        << result.config.concurrency << "\n";

    out.flush();
    if (!out) {
        Logger::log(LogLevel::Error, "Short write to report " + output_path.string(), "main");
        return false;
    }
    return true;
}
