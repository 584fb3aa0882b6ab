#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "SCS.hpp"
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace SCS {

/**
 * @brief INI-style configuration reader
 *
 * Sections are written as [NAME], entries as key = value. Lines
 * starting with # or ; are comments, and # also starts an inline
 * comment after a value.
 *
 * Recognized sections:
 * @code
 * [SEARCH]
 * preference = auto            # auto, tm, zone
 *
 * [MAP]
 * wkid = 3857
 * center_longitude = 15.0
 *
 * [TRANSFORM]
 * load_timeout_ms = 5000
 * worker_threads = 2
 * @endcode
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    bool loadFile(const std::string& filename);

    /**
     * @brief Fill a search configuration from the loaded data
     *
     * Missing keys keep the values already in @p config.
     * @return false if a present value is invalid; @p config then holds
     *         every value that could be read
     */
    bool parseSearchConfig(SearchConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    static void generateTemplate(const std::string& filename);

    /// Overlay another file; its values override existing ones
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    std::string trim(const std::string& str) const;
};

} // namespace SCS

#endif // CONFIG_READER_HPP
