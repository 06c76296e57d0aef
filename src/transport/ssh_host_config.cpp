#include "transport/ssh_host_config.hpp"
#include "backup/backup_config.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Splits "Keyword value" or "Keyword=value".
static bool splitKeyword(const std::string& line, std::string& keyword, std::string& value) {
    size_t sep = line.find_first_of(" \t=");
    if (sep == std::string::npos) {
        return false;
    }
    keyword = toLower(line.substr(0, sep));
    std::string rest = line.substr(sep);
    size_t valueStart = rest.find_first_not_of(" \t=");
    if (valueStart == std::string::npos) {
        return false;
    }
    value = trim(rest.substr(valueStart));
    return true;
}

bool SshHostConfig::matchPattern(const std::string& pattern, const std::string& value) {
    size_t p = 0, v = 0;
    size_t starP = std::string::npos, starV = 0;
    while (v < value.size()) {
        if (p < pattern.size() && (pattern[p] == '?' ||
                                   std::tolower(static_cast<unsigned char>(pattern[p])) ==
                                       std::tolower(static_cast<unsigned char>(value[v])))) {
            ++p;
            ++v;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starV = v;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            v = ++starV;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

SshHostEntry SshHostConfig::resolve(std::istream& config, const std::string& alias) {
    SshHostEntry entry;
    entry.alias = alias;
    bool portSet = false;
    bool active = true;  // lines before the first Host block apply to every host

    std::string raw;
    while (std::getline(config, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::string keyword, value;
        if (!splitKeyword(line, keyword, value)) {
            continue;
        }

        if (keyword == "host") {
            bool matched = false;
            bool negated = false;
            std::istringstream patterns(value);
            std::string pattern;
            while (patterns >> pattern) {
                pattern = unquote(pattern);
                if (!pattern.empty() && pattern[0] == '!') {
                    if (matchPattern(pattern.substr(1), alias)) {
                        negated = true;
                    }
                } else if (matchPattern(pattern, alias)) {
                    matched = true;
                }
            }
            active = matched && !negated;
            continue;
        }
        if (keyword == "match") {
            // Match blocks are not evaluated
            active = false;
            continue;
        }
        if (!active) {
            continue;
        }

        value = unquote(value);
        if (keyword == "hostname" && entry.hostName.empty()) {
            std::string hostName = value;
            size_t token = hostName.find("%h");
            if (token != std::string::npos) {
                hostName.replace(token, 2, alias);
            }
            entry.hostName = hostName;
        } else if (keyword == "user" && entry.user.empty()) {
            entry.user = value;
        } else if (keyword == "port" && !portSet) {
            try {
                entry.port = std::stoi(value);
                portSet = true;
            } catch (const std::exception&) {
                Logger::warning("Ignoring invalid Port in ssh config: " + value);
            }
        } else if (keyword == "identityfile" && entry.identityFile.empty()) {
            entry.identityFile = expandUser(value);
        }
    }

    if (entry.hostName.empty()) {
        entry.hostName = alias;
    }
    return entry;
}

SshHostEntry SshHostConfig::resolve(const std::string& configPath, const std::string& alias) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::debug("No ssh config at " + configPath + ", using " + alias + " as address");
        SshHostEntry entry;
        entry.alias = alias;
        entry.hostName = alias;
        return entry;
    }
    return resolve(file, alias);
}

std::string defaultSshConfigPath() {
    return expandUser("~/.ssh/config");
}

std::string defaultKnownHostsPath() {
    return expandUser("~/.ssh/known_hosts");
}
