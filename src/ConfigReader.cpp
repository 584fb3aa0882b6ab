#include "ConfigReader.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace SCS {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            current_section = trim(current_section);
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    file.close();
    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::invalid_argument&) {
        return default_val;
    } catch (const std::out_of_range&) {
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::invalid_argument&) {
        return default_val;
    } catch (const std::out_of_range&) {
        return default_val;
    }
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

bool ConfigReader::parseSearchConfig(SearchConfig& config) const {
    bool ok = true;

    if (hasKey("SEARCH", "preference")) {
        std::string value = getString("SEARCH", "preference");
        auto preference = parsePreference(value);
        if (preference) {
            config.preference = *preference;
        } else {
            std::cerr << "Error: Unknown projection preference '" << value
                      << "' (expected auto, tm or zone)" << std::endl;
            ok = false;
        }
    }

    if (hasKey("MAP", "wkid")) {
        int wkid = getInt("MAP", "wkid", 0);
        if (wkid > 0) {
            config.map_wkid = wkid;
        } else {
            std::cerr << "Error: Invalid [MAP] wkid: " << getString("MAP", "wkid") << std::endl;
            ok = false;
        }
    }

    if (hasKey("MAP", "center_longitude")) {
        double lon = getDouble("MAP", "center_longitude", NAN);
        if (std::isfinite(lon) && lon >= -180.0 && lon <= 180.0) {
            config.center_longitude = lon;
        } else {
            std::cerr << "Error: Invalid [MAP] center_longitude: "
                      << getString("MAP", "center_longitude") << std::endl;
            ok = false;
        }
    }

    if (hasKey("TRANSFORM", "load_timeout_ms")) {
        int timeout = getInt("TRANSFORM", "load_timeout_ms", 0);
        if (timeout > 0) {
            config.load_timeout = std::chrono::milliseconds(timeout);
        } else {
            std::cerr << "Error: Invalid [TRANSFORM] load_timeout_ms: "
                      << getString("TRANSFORM", "load_timeout_ms") << std::endl;
            ok = false;
        }
    }

    if (hasKey("TRANSFORM", "worker_threads")) {
        int threads = getInt("TRANSFORM", "worker_threads", 0);
        if (threads > 0) {
            config.worker_threads = threads;
        } else {
            std::cerr << "Error: Invalid [TRANSFORM] worker_threads: "
                      << getString("TRANSFORM", "worker_threads") << std::endl;
            ok = false;
        }
    }

    return ok;
}

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write configuration template: " << filename << std::endl;
        return;
    }

    file << "# SCS Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[SEARCH]\n";
    file << "preference = auto                     # auto, tm, zone\n\n";

    file << "[MAP]\n";
    file << "# Spatial reference of the map (target of the transform)\n";
    file << "wkid = 3857                           # Web Mercator\n";
    file << "# Map center, used to rank SWEREF 99 zones\n";
    file << "# center_longitude = 15.0\n\n";

    file << "[TRANSFORM]\n";
    file << "load_timeout_ms = 5000\n";
    file << "worker_threads = 2\n";

    file.close();
    std::cout << "Configuration template written to: " << filename << std::endl;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    static const std::map<std::string, std::vector<std::string>> known = {
        {"SEARCH", {"preference"}},
        {"MAP", {"wkid", "center_longitude"}},
        {"TRANSFORM", {"load_timeout_ms", "worker_threads"}},
    };

    for (const auto& section : getSections()) {
        auto it = known.find(section);
        if (it == known.end()) {
            result.warnings.push_back("Unknown section [" + section + "] ignored");
            continue;
        }
        const auto& keys = it->second;
        for (const auto& key : getKeys(section)) {
            if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
                result.warnings.push_back("Unknown key '" + key + "' in [" +
                                          section + "] ignored");
            }
        }
    }

    if (!hasSection("MAP")) {
        result.warnings.push_back("No [MAP] section found - using defaults");
    }

    if (hasKey("SEARCH", "preference") && !parsePreference(getString("SEARCH", "preference"))) {
        result.errors.push_back("Invalid preference (must be auto, tm or zone)");
        result.valid = false;
    }

    if (hasKey("MAP", "wkid") && getInt("MAP", "wkid", 0) <= 0) {
        result.errors.push_back("Invalid map wkid (must be a positive integer)");
        result.valid = false;
    }

    if (hasKey("MAP", "center_longitude")) {
        double lon = getDouble("MAP", "center_longitude", NAN);
        if (!std::isfinite(lon) || lon < -180.0 || lon > 180.0) {
            result.errors.push_back("Invalid center_longitude (must be -180 to 180)");
            result.valid = false;
        }
    }

    if (hasKey("TRANSFORM", "load_timeout_ms") && getInt("TRANSFORM", "load_timeout_ms", 0) <= 0) {
        result.errors.push_back("Invalid load_timeout_ms (must be positive)");
        result.valid = false;
    }

    if (hasKey("TRANSFORM", "worker_threads") && getInt("TRANSFORM", "worker_threads", 0) <= 0) {
        result.errors.push_back("Invalid worker_threads (must be positive)");
        result.valid = false;
    }

    return result;
}

} // namespace SCS
