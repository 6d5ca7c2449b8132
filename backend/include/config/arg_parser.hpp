#pragma once

#include <map>
#include <string>
#include <vector>

namespace candlecast::config {

// Parses "--name value" and "--name=value" pairs; everything else is positional.
class ArgParser {
public:
    ArgParser(int argc, char** argv);

    bool has(const std::string& name) const;
    std::string get(const std::string& name, const std::string& fallback = {}) const;
    const std::vector<std::string>& positional() const { return positional_; }

    // Names in required that were not supplied.
    std::vector<std::string> missing(const std::vector<std::string>& required) const;

private:
    std::map<std::string, std::string> options_;
    std::vector<std::string> positional_;
};

} // namespace candlecast::config
