#include <evalforge/config/config_helpers.h>

#include <fstream>

namespace evalforge::config {

bool env_truthy(const char* value) {
    if (!value || !*value)
        return false;
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return !(v == "0" || v == "false" || v == "off" || v == "no");
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']')
        body = body.substr(1, body.size() - 2);

    std::vector<std::string> out;
    std::string current;
    char quote = 0;
    auto flush = [&]() {
        auto item = unquote(current);
        if (!item.empty())
            out.push_back(std::move(item));
        current.clear();
    };
    for (char c : body) {
        if (quote) {
            if (c == quote)
                quote = 0;
            current.push_back(c);
        } else if (c == '"' || c == '\'') {
            quote = c;
            current.push_back(c);
        } else if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return out;
}

namespace {

// Cuts a trailing "# comment" that is not inside a quoted string.
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

} // namespace

std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file)
        return config;

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        line = strip_comment(line);
        trim(line);
        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = line.substr(1, line.size() - 2);
            trim(currentSection);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = line.substr(0, eq);
        trim(key);
        std::string value = line.substr(eq + 1);
        trim(value);
        // Arrays keep their brackets for parse_string_list.
        if (value.empty() || value.front() != '[')
            value = unquote(value);

        if (!currentSection.empty())
            config[currentSection + "." + key] = value;
        else
            config[key] = value;
    }
    return config;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "evalforge";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "evalforge";
    return std::filesystem::path(".config") / "evalforge";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty())
        return expand_tilde(override_path);
    if (const char* env = std::getenv("EVALFORGE_CONFIG"); env && *env)
        return expand_tilde(env);
    return get_config_dir() / "config.toml";
}

} // namespace evalforge::config
