/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace tier_gate {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files == 0 ? 1 : max_files) {
    std::filesystem::create_directories(log_dir_);
    auto path = active_path();

    std::error_code ec;
    auto existing = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : existing;
    current_file_.open(path, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::active_path() const {
    return generation_path(0);
}

std::filesystem::path JsonFileSink::generation_path(uint32_t generation) const {
    if (generation == 0) return log_dir_ / (prefix_ + ".ndjson");
    return log_dir_ / (prefix_ + "." + std::to_string(generation) + ".ndjson");
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed(json_line.size() + 1);
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed(size_t incoming) {
    if (current_size_ == 0 || current_size_ + incoming <= max_file_size_bytes_) return;

    current_file_.close();

    // A failed rename leaves the log appending to the active file.
    std::error_code ec;
    std::filesystem::remove(generation_path(max_files_ - 1), ec);
    for (uint32_t gen = max_files_ - 1; gen > 0; --gen) {
        auto from = generation_path(gen - 1);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, generation_path(gen), ec);
        }
    }

    current_file_.open(active_path(), std::ios::app);
    std::error_code size_ec;
    auto remaining = std::filesystem::file_size(active_path(), size_ec);
    current_size_ = size_ec ? 0 : remaining;
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

}  // namespace tier_gate
