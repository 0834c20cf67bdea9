#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open config file: " << filepath;
        return false;
    }

    std::string currentSection;
    std::string line;
    int lineNumber = 0;

    while (std::getline(file, line)) {
        lineNumber++;
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // [Section]
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            currentSection = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos) {
            Logger::warning() << filepath << ":" << lineNumber << ": ignoring line without '='";
            continue;
        }

        std::string key = trim(line.substr(0, equalPos));
        std::string value = trim(line.substr(equalPos + 1));

        size_t commentPos = value.find_first_of("#;");
        if (commentPos != std::string::npos) {
            value = trim(value.substr(0, commentPos));
        }

        if (!currentSection.empty() && !key.empty()) {
            m_data[currentSection][key] = value;
        }
    }

    return true;
}

void Config::clear() {
    m_data.clear();
}

const std::string* Config::find(const std::string& section, const std::string& key) const {
    auto sectionIt = m_data.find(section);
    if (sectionIt == m_data.end()) {
        return nullptr;
    }
    auto keyIt = sectionIt->second.find(key);
    if (keyIt == sectionIt->second.end()) {
        return nullptr;
    }
    return &keyIt->second;
}

bool Config::has(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

int Config::getInt(const std::string& section, const std::string& key, int defaultValue) const {
    const std::string* value = find(section, key);
    if (value) {
        try {
            return std::stoi(*value);
        } catch (const std::exception&) {
            Logger::warning() << "Failed to parse int for [" << section << "]:" << key
                              << " = '" << *value << "'";
        }
    }
    return defaultValue;
}

float Config::getFloat(const std::string& section, const std::string& key, float defaultValue) const {
    const std::string* value = find(section, key);
    if (value) {
        try {
            return std::stof(*value);
        } catch (const std::exception&) {
            Logger::warning() << "Failed to parse float for [" << section << "]:" << key
                              << " = '" << *value << "'";
        }
    }
    return defaultValue;
}

bool Config::getBool(const std::string& section, const std::string& key, bool defaultValue) const {
    const std::string* value = find(section, key);
    if (!value) {
        return defaultValue;
    }

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;

    Logger::warning() << "Failed to parse bool for [" << section << "]:" << key
                      << " = '" << *value << "'";
    return defaultValue;
}

std::string Config::getString(const std::string& section, const std::string& key, const std::string& defaultValue) const {
    const std::string* value = find(section, key);
    return value ? *value : defaultValue;
}

std::string Config::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool Config::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open config file for writing: " << filepath;
        return false;
    }

    for (const auto& section : m_data) {
        file << "[" << section.first << "]\n";
        for (const auto& keyValue : section.second) {
            file << keyValue.first << " = " << keyValue.second << "\n";
        }
        file << "\n";
    }

    return true;
}

void Config::setInt(const std::string& section, const std::string& key, int value) {
    m_data[section][key] = std::to_string(value);
}

void Config::setFloat(const std::string& section, const std::string& key, float value) {
    std::ostringstream oss;
    oss << value;
    m_data[section][key] = oss.str();
}

void Config::setBool(const std::string& section, const std::string& key, bool value) {
    m_data[section][key] = value ? "1" : "0";
}

void Config::setString(const std::string& section, const std::string& key, const std::string& value) {
    m_data[section][key] = value;
}

// ========== WorldSettings ==========

WorldSettings WorldSettings::fromConfig(const Config& config) {
    WorldSettings s;

    s.renderDistance = config.getInt("World", "render_distance", s.renderDistance);
    if (s.renderDistance < 1) {
        Logger::warning() << "render_distance " << s.renderDistance << " is below 1, using 1";
        s.renderDistance = 1;
    }
    s.seed = config.getInt("World", "seed", s.seed);

    std::string generator = config.getString("World", "generator", "noise");
    if (generator == "flat") {
        s.generator = GeneratorKind::FLAT;
    } else if (generator != "noise") {
        Logger::warning() << "Unknown generator '" << generator << "', using noise";
    }
    s.flatHeight = config.getInt("World", "flat_height", s.flatHeight);

    s.pickMaxDistance = config.getFloat("Picker", "max_distance", s.pickMaxDistance);
    s.pickStep = config.getFloat("Picker", "step", s.pickStep);
    if (s.pickStep <= 0.0f) {
        Logger::warning() << "Picker step must be positive, using 0.1";
        s.pickStep = 0.1f;
    }

    s.aoRotation = config.getInt("Mesh", "ao_rotation", s.aoRotation) & 3;

    s.blockManifest = config.getString("Blocks", "manifest", s.blockManifest);

    s.logLevel = config.getString("Logging", "level", s.logLevel);
    s.logColors = config.getBool("Logging", "colors", s.logColors);

    s.demoFrames = config.getInt("Demo", "frames", s.demoFrames);
    s.demoSpeed = config.getFloat("Demo", "speed", s.demoSpeed);

    return s;
}
