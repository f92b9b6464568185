#ifndef AUDIOBATCH_REPORT_GENERATOR_HPP
#define AUDIOBATCH_REPORT_GENERATOR_HPP

#include "../../../libaudiobatch/include/session.hpp"
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

// one failed conversion, as shown in the reports
struct FailureRow {
    std::filesystem::path path;
    std::string mime;
    std::string error_msg;
};

/**
 * @brief Annotates failures with their detected MIME type, sorted by path.
 */
std::vector<FailureRow> build_failure_rows(const std::vector<audiobatch::FailureRecord>& failures);

unsigned get_terminal_width();

std::string csv_escape(const std::string& data);

/**
 * @brief Prints the final report: every failure, then "DONE" with totals.
 * A cancelled run prints only "Stopped, progress saved".
 */
void print_console_report(std::ostream& out,
                          const audiobatch::SessionResult& result,
                          const std::vector<FailureRow>& failures,
                          bool use_colors);

/**
 * @brief Writes failures and run totals as CSV.
 * @return false if the file could not be written (logged).
 */
bool export_csv_report(const audiobatch::SessionResult& result,
                       const std::vector<FailureRow>& failures,
                       const std::filesystem::path& output_path);

#endif // AUDIOBATCH_REPORT_GENERATOR_HPP
