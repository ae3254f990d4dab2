/**
 * @file LogoRepository.cpp
 * @brief Implementation of LogoRepository.
 */

#include "infrastructure/LogoRepository.hpp"
#include <cctype>
#include <chrono>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <thread>

namespace logoscout::infrastructure {

namespace fs = std::filesystem;

LogoRepository::LogoRepository(fs::path assetsDir)
    : m_assetsDir(std::move(assetsDir)) {}

std::string LogoRepository::SanitizeFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    bool pendingSeparator = false;
    for (unsigned char c : name) {
        const unsigned char lower = static_cast<unsigned char>(std::tolower(c));
        if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9')) {
            if (pendingSeparator && !out.empty()) {
                out.push_back('_');
            }
            pendingSeparator = false;
            out.push_back(static_cast<char>(lower));
        } else {
            pendingSeparator = true;
        }
    }
    return out;
}

fs::path LogoRepository::save(const std::string& companyKey,
                              const std::string& extension,
                              const std::string& bytes) const {
    std::string stem = SanitizeFilename(companyKey);
    if (stem.empty()) {
        stem = "logo";
    }

    std::error_code ec;
    fs::create_directories(m_assetsDir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create assets directory " + m_assetsDir.string() + ": " + ec.message());
    }

    const fs::path finalPath = fs::absolute(m_assetsDir / (stem + "." + extension));

    // filename.<timestamp>-<thread>.tmp keeps concurrent writers apart.
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto threadTag = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "-" + std::to_string(threadTag) + ".tmp";

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed: " + tempPath.string());
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tempPath, ec);
        throw std::runtime_error("Rename failed for " + finalPath.string() + ": " + reason);
    }
    return finalPath;
}

} // namespace logoscout::infrastructure
