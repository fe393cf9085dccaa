#pragma once
/**
 * @file Config.h
 * @brief "Section.Key" configuration values loaded from YAML.
 */
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ensemble {
    /**
     * @brief Read-only view of configuration values.
     */
    class ConfigSource {
    public:
        virtual ~ConfigSource() = default;

        /** @return the raw value of `key`, if set */
        virtual std::optional<std::string> get(const std::string& key) const = 0;
    };

    /**
     * @brief Configuration with built-in defaults, overlaid by YAML files and explicit settings.
     *
     * The YAML layout is a map of sections to maps of keys:
     * @code
     * MCS:
     *   MaxWorkers: 16
     * SLURM:
     *   Partition: short
     * @endcode
     */
    class Config final : public ConfigSource {
    public:
        /** @brief A configuration holding only the defaults. */
        Config();

        /**
         * @brief Defaults overlaid by the YAML file at `path`.
         * @throws ConfigurationError if the file cannot be read or has the wrong shape
         */
        static Config fromYamlFile(const std::string& path);

        /** @throws ConfigurationError on malformed input */
        static Config fromYamlString(const std::string& text);

        /** @brief Overlay the sections of one YAML document. */
        void merge(const std::string& yamlText);

        void set(const std::string& key, const std::string& value) { values_[key] = value; }

        std::optional<std::string> get(const std::string& key) const override;

        /** @throws ConfigurationError if `key` is not set */
        std::string getString(const std::string& key) const;
        std::string getString(const std::string& key, const std::string& fallback) const;

        /** @throws ConfigurationError if the value is not an integer */
        int getInt(const std::string& key) const;
        int64_t getInt64(const std::string& key) const;

        /** @throws ConfigurationError if the value is not a number */
        double getDouble(const std::string& key) const;

        /** @brief true/false, yes/no, on/off, 1/0, case-insensitive. */
        bool getBool(const std::string& key) const;

        const std::map<std::string, std::string>& values() const noexcept { return values_; }

    private:
        std::map<std::string, std::string> values_;
    };

    /**
     * @brief Expand a year specification such as "1990,2005-2100:5".
     *
     * Ranges default to a step of 5. The result is sorted and unique.
     * @throws ConfigurationError on malformed input
     */
    std::vector<int> parseYears(const std::string& spec);
}
