#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace GOAS {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream in(content);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // key = value
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

    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(val, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos != val.size()) {
        throw std::invalid_argument("Invalid integer for [" + section + "] " + key + ": " + val);
    }
    return result;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(val, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos != val.size()) {
        throw std::invalid_argument("Invalid number for [" + section + "] " + key + ": " + val);
    }
    return result;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    throw std::invalid_argument("Invalid boolean for [" + section + "] " + key + ": " + val);
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

void ConfigReader::parseSolverOptions(SolverOptions& options) const {
    // [solver]
    options.solver_name = getString("solver", "name", options.solver_name);
    options.theta = getDouble("solver", "theta", options.theta);
    options.absolute_tolerance = getDouble("solver", "absolute_tolerance",
                                           options.absolute_tolerance);
    options.relative_tolerance = getDouble("solver", "relative_tolerance",
                                           options.relative_tolerance);
    options.max_nonlinear_iterations = getInt("solver", "max_nonlinear_iterations",
                                              static_cast<int>(options.max_nonlinear_iterations));
    options.monitor_convergence = getBool("solver", "monitor_convergence",
                                          options.monitor_convergence);

    // [adaptivity]
    options.adaptive = getBool("adaptivity", "adaptive", options.adaptive);
    options.adapt_ratio = getDouble("adaptivity", "adapt_ratio", options.adapt_ratio);
    options.max_adaptations = getInt("adaptivity", "max_adaptations",
                                     static_cast<int>(options.max_adaptations));
    options.adaptive_tolerance = getDouble("adaptivity", "adaptive_TOL",
                                           options.adaptive_tolerance);
    if (hasKey("adaptivity", "stopping_metric")) {
        options.stopping_metric = parseStoppingMetric(getString("adaptivity", "stopping_metric"));
    }
    options.refinement_algorithm = getString("adaptivity", "refinement_algorithm",
                                             options.refinement_algorithm);
    options.on_disk = getDouble("adaptivity", "on_disk", options.on_disk);
    options.tape_nonlinear_iterates = getBool("adaptivity", "tape_nonlinear_iterates",
                                              options.tape_nonlinear_iterates);
    options.optimize = getBool("adaptivity", "optimize", options.optimize);

    // [output]
    options.save_solution = getBool("output", "save_solution", options.save_solution);
    options.save_frequency = getInt("output", "save_frequency",
                                    static_cast<int>(options.save_frequency));
    options.folder = getString("output", "folder", options.folder);
    if (!options.folder.empty() && options.folder.back() != '/') {
        options.folder += '/';
    }
    options.check_mem_usage = getBool("output", "check_mem_usage", options.check_mem_usage);
    options.verbosity = getInt("output", "verbosity", static_cast<int>(options.verbosity));
    if (options.verbosity > 1) {
        options.monitor_convergence = true;
    }
}

void ConfigReader::parseProblemParameters(ProblemParameters& params) const {
    params.name = getString("problem", "name", params.name);
    params.nx = getInt("problem", "nx", static_cast<int>(params.nx));
    params.lower = getDouble("problem", "lower", params.lower);
    params.upper = getDouble("problem", "upper", params.upper);
    params.coefficient = getDouble("problem", "coefficient", params.coefficient);
    params.source = getDouble("problem", "source", params.source);
    params.boundary_rate = getDouble("problem", "boundary_rate", params.boundary_rate);
    params.goal_center = getDouble("problem", "goal_center", params.goal_center);
    params.goal_width = getDouble("problem", "goal_width", params.goal_width);
    params.cfl = getDouble("problem", "cfl", params.cfl);
    params.target_functional = getDouble("problem", "target_functional",
                                         params.target_functional);

    params.time.t0 = getDouble("time", "t0", params.time.t0);
    params.time.T = getDouble("time", "T", params.time.T);
    params.time.k = getDouble("time", "k", params.time.k);
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Values of the merged file override existing ones
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

    if (!hasSection("problem")) {
        result.warnings.push_back("No [problem] section found - using defaults");
    }
    if (!hasSection("time")) {
        result.warnings.push_back("No [time] section found - using defaults");
    }

    SolverOptions options;
    ProblemParameters params;
    try {
        parseSolverOptions(options);
        parseProblemParameters(params);
    } catch (const std::invalid_argument& e) {
        result.errors.push_back(e.what());
        result.valid = false;
        return result;
    }

    if (options.theta < 0.0 || options.theta > 1.0) {
        result.errors.push_back("Invalid theta (must be 0-1)");
    }
    if (options.adapt_ratio <= 0.0 || options.adapt_ratio > 1.0) {
        result.errors.push_back("Invalid adapt_ratio (must be in (0, 1])");
    }
    if (options.on_disk < 0.0 || options.on_disk > 1.0) {
        result.errors.push_back("Invalid on_disk fraction (must be 0-1)");
    }
    if (options.max_adaptations < 0) {
        result.errors.push_back("max_adaptations must be non-negative");
    }
    if (options.save_frequency < 0) {
        result.errors.push_back("save_frequency must be non-negative");
    }
    if (options.refinement_algorithm != "regular_cut" &&
        options.refinement_algorithm != "buffered") {
        result.errors.push_back("Unknown refinement_algorithm: " + options.refinement_algorithm);
    }
    if (params.nx < 1) {
        result.errors.push_back("nx must be at least 1");
    }
    if (params.upper <= params.lower) {
        result.errors.push_back("Interval upper bound must exceed lower bound");
    }
    if (params.time.T <= params.time.t0) {
        result.errors.push_back("T must exceed t0");
    }
    if (params.time.k <= 0.0) {
        result.errors.push_back("Time step k must be positive");
    }

    const auto names = availableProblems();
    if (std::find(names.begin(), names.end(), params.name) == names.end()) {
        result.errors.push_back("Unknown problem: " + params.name);
    }

    if (options.optimize && params.name != "poisson") {
        result.warnings.push_back("optimize is only supported by the poisson problem");
    }

    result.valid = result.errors.empty();
    return result;
}

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write configuration template: " + filename);
    }

    file << "# GOAS Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[problem]\n";
    file << "name = heat                           # heat, burgers, poisson\n";
    file << "nx = 16                               # Initial cells\n";
    file << "lower = 0.0\n";
    file << "upper = 1.0\n";
    file << "coefficient = -1                      # Diffusivity/viscosity, < 0 for default\n";
    file << "source = 1.0                          # Poisson load\n";
    file << "boundary_rate = 0.0                   # Heat: u(1, t) = rate * t\n";
    file << "goal_center = -1                      # Goal weight center, < 0 for default\n";
    file << "goal_width = 0.05\n";
    file << "cfl = 0.5                             # Burgers time step rule\n";
    file << "target_functional = 0.01              # Poisson optimization target\n\n";

    file << "[time]\n";
    file << "t0 = 0.0\n";
    file << "T = 1.0\n";
    file << "k = 0.1                               # Adjusted to divide T - t0\n\n";

    file << "[solver]\n";
    file << "name = Theta\n";
    file << "theta = 0.5                           # 0 explicit, 0.5 Crank-Nicolson, 1 implicit\n";
    file << "absolute_tolerance = 1.0e-10\n";
    file << "relative_tolerance = 1.0e-9\n";
    file << "max_nonlinear_iterations = 50\n";
    file << "monitor_convergence = false\n\n";

    file << "[adaptivity]\n";
    file << "adaptive = false\n";
    file << "adapt_ratio = 0.1                     # Fraction of cells considered for refinement\n";
    file << "max_adaptations = 10\n";
    file << "adaptive_TOL = 1.0e-4\n";
    file << "stopping_metric = indicator_sum       # indicator_sum, signed_indicator_sum, functional_difference\n";
    file << "refinement_algorithm = regular_cut    # regular_cut, buffered\n";
    file << "on_disk = 0.0                         # Fraction of tape snapshots kept on disk\n";
    file << "tape_nonlinear_iterates = false\n";
    file << "optimize = false\n\n";

    file << "[output]\n";
    file << "save_solution = false\n";
    file << "save_frequency = 0                    # 0 disables snapshots\n";
    file << "folder = ./\n";
    file << "check_mem_usage = false\n";
    file << "verbosity = 1                         # 0 quiet, 1 normal, 2 Newton monitor\n";
}

} // namespace GOAS
