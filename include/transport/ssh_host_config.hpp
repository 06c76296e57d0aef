#pragma once

#include <istream>
#include <string>

// Connection parameters for one host alias, as OpenSSH would resolve them.
struct SshHostEntry {
    std::string alias;
    std::string hostName;
    std::string user;
    int port = 22;
    std::string identityFile;
};

// Resolves host aliases from an OpenSSH client config file. Only the
// Host, HostName, User, Port and IdentityFile keywords are understood;
// for each keyword the first value obtained wins.
class SshHostConfig {
public:
    // A missing file resolves every alias to itself.
    static SshHostEntry resolve(const std::string& configPath, const std::string& alias);
    static SshHostEntry resolve(std::istream& config, const std::string& alias);

    // Glob match supporting '*' and '?'.
    static bool matchPattern(const std::string& pattern, const std::string& value);
};

// Default OpenSSH client paths under ~/.ssh
std::string defaultSshConfigPath();
std::string defaultKnownHostsPath();
