#include <ai-autobuilder/log/run_log.hpp>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace autobuilder {

std::string format_log_timestamp(std::chrono::system_clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    int frac = static_cast<int>((micros % 1000000 + 1000000) % 1000000);
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    if (localtime_r(&secs, &local) == nullptr) return std::string();
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << frac;
    return out.str();
}

bool RunLogger::append(const std::string& text, std::string* error) const {
    return append(text, std::chrono::system_clock::now(), error);
}

bool RunLogger::append(const std::string& text, std::chrono::system_clock::time_point when, std::string* error) const {
    if (m_file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(m_file.parent_path(), ec);
        if (ec) { if (error) *error = "cannot create " + m_file.parent_path().string() + ": " + ec.message(); return false; }
    }
    std::ofstream out(m_file, std::ios::binary | std::ios::app);
    if (!out) { if (error) *error = "cannot open " + m_file.string(); return false; }
    out << "\n[" << format_log_timestamp(when) << "]\n" << text << "\n";
    out.close();
    if (out.fail()) { if (error) *error = "write to " + m_file.string() + " failed"; return false; }
    return true;
}

} // namespace autobuilder
