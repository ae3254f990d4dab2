/**
 * @file LogoRepository.hpp
 * @brief Stores downloaded logo bytes in the assets directory.
 */

#pragma once
#include <filesystem>
#include <string>

namespace logoscout::infrastructure {

/**
 * @class LogoRepository
 * @brief Writes one file per company: "<sanitized company>.<extension>".
 *
 * Writes go to a temp file that is then renamed over the target, so
 * concurrent saves for different companies never see partial files.
 */
class LogoRepository {
public:
    explicit LogoRepository(std::filesystem::path assetsDir);

    /**
     * @brief Persists a logo.
     * @param companyKey Resolved company key; sanitized into the file stem.
     * @param extension Extension without the dot ("png", "svg", ...).
     * @param bytes Raw image data.
     * @return Absolute path of the written file.
     * @throws std::runtime_error if the directory or file cannot be written.
     */
    std::filesystem::path save(const std::string& companyKey,
                               const std::string& extension,
                               const std::string& bytes) const;

    const std::filesystem::path& assetsDir() const { return m_assetsDir; }

    /** @brief Lowercase, runs of non [a-z0-9] become '_', leading/trailing '_' trimmed. */
    static std::string SanitizeFilename(const std::string& name);

private:
    std::filesystem::path m_assetsDir;
};

} // namespace logoscout::infrastructure
