#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "GOAS.hpp"
#include "ProblemLibrary.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace GOAS {

/**
 * @brief INI-style configuration reader
 *
 * Sections:
 *   [problem]     model problem and its parameters
 *   [time]        t0, T, k
 *   [solver]      time stepping and nonlinear solver
 *   [adaptivity]  goal-oriented refinement loop
 *   [output]      file output and diagnostics
 *
 * Lines starting with # or ; are comments, values may carry a trailing
 * # comment.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Parse a configuration from a string (same syntax as a file)
    bool loadString(const std::string& content);

    // =========================================================================
    // Parsing
    // =========================================================================

    /**
     * @brief Fill solver options from [solver], [adaptivity] and [output]
     *
     * Keys that are absent keep the value already in options.
     * @throws std::invalid_argument for malformed values
     */
    void parseSolverOptions(SolverOptions& options) const;

    /**
     * @brief Fill problem parameters from [problem] and [time]
     */
    void parseProblemParameters(ProblemParameters& params) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& in);
    std::string trim(const std::string& str) const;
};

} // namespace GOAS

#endif // CONFIG_READER_HPP
