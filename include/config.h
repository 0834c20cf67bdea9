/**
 * @file config.h
 * @brief INI configuration store and the world settings read from it
 */

#pragma once
#include <string>
#include <map>

/**
 * @brief Singleton INI configuration
 *
 * Format: `[Section]` headers, `key = value` pairs, `#` or `;` comments
 * (full-line or trailing). Keys outside any section are ignored.
 */
class Config {
public:
    static Config& instance();

    bool loadFromFile(const std::string& filepath);
    bool saveToFile(const std::string& filepath) const;

    /// Drops every section (tests reuse the singleton)
    void clear();

    bool has(const std::string& section, const std::string& key) const;

    int getInt(const std::string& section, const std::string& key, int defaultValue = 0) const;
    float getFloat(const std::string& section, const std::string& key, float defaultValue = 0.0f) const;
    bool getBool(const std::string& section, const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& section, const std::string& key, const std::string& defaultValue = "") const;

    void setInt(const std::string& section, const std::string& key, int value);
    void setFloat(const std::string& section, const std::string& key, float value);
    void setBool(const std::string& section, const std::string& key, bool value);
    void setString(const std::string& section, const std::string& key, const std::string& value);

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    const std::string* find(const std::string& section, const std::string& key) const;

    std::map<std::string, std::map<std::string, std::string>> m_data;

    std::string trim(const std::string& str) const;
};

/**
 * @brief Which terrain generator the world uses
 */
enum class GeneratorKind {
    NOISE,  ///< FastNoiseLite height field with snow/grass/dirt/stone layering
    FLAT    ///< Solid below a fixed height
};

/**
 * @brief Typed view over the settings the world, picker and demo read
 *
 * Defaults apply for every key absent from the config.
 */
struct WorldSettings {
    int renderDistance = 8;                      ///< [World] render_distance (chunks)
    int seed = 69;                               ///< [World] seed
    GeneratorKind generator = GeneratorKind::NOISE; ///< [World] generator = noise | flat
    int flatHeight = 128;                        ///< [World] flat_height (top solid Y)

    float pickMaxDistance = 16.0f;               ///< [Picker] max_distance
    float pickStep = 0.1f;                       ///< [Picker] step

    int aoRotation = 0;                          ///< [Mesh] ao_rotation (0-3)

    std::string blockManifest = "assets/blocks.yaml"; ///< [Blocks] manifest

    std::string logLevel = "INFO";               ///< [Logging] level
    bool logColors = true;                       ///< [Logging] colors

    int demoFrames = 120;                        ///< [Demo] frames
    float demoSpeed = 4.0f;                      ///< [Demo] speed (blocks per frame)

    static WorldSettings fromConfig(const Config& config);
};
