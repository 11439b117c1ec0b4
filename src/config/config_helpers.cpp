#include <dsexport/config/config_helpers.h>

#include <fstream>

namespace dsexport::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside quotes only)
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        } else if (!v.empty()) {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "exporter.token" at top level and "[exporter] token"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "dsexport";
    }
    const char* homeEnv = std::getenv("HOME");
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "dsexport";
    }
    return std::filesystem::path(".config") / "dsexport";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

std::map<std::string, std::string> load_dotenv(const std::filesystem::path& path) {
    std::map<std::string, std::string> out;
    std::ifstream file(path);
    if (!file) {
        return out;
    }

    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (line.rfind("export ", 0) == 0) {
            line.erase(0, 7);
            ltrim(line);
        }

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            auto comment = v.find(" #");
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }
        out[k] = unquote(v);
    }
    return out;
}

} // namespace dsexport::config
