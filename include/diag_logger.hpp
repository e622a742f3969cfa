// ===================== File: include/diag_logger.hpp =====================
#pragma once
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace netprobe {

// Timestamped line logger handed to every prober as an optional pointer.
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path);
    explicit DiagLogger(std::ostream& out);
    ~DiagLogger();

    bool ok() const { return out_ != nullptr; }
    void log(const std::string& line);

private:
    std::ofstream file_;
    std::ostream* out_ = nullptr;
    std::mutex mu_;
};

} // namespace netprobe
