#include "config/arg_parser.hpp"

namespace candlecast::config {

ArgParser::ArgParser(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            std::string name = arg.substr(2);
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                options_[name.substr(0, eq)] = name.substr(eq + 1);
            } else if (i + 1 < argc && std::string(argv[i + 1]).compare(0, 2, "--") != 0) {
                options_[name] = argv[++i];
            } else {
                options_[name] = "";
            }
        } else {
            positional_.push_back(std::move(arg));
        }
    }
}

bool ArgParser::has(const std::string& name) const {
    return options_.count(name) != 0;
}

std::string ArgParser::get(const std::string& name, const std::string& fallback) const {
    auto it = options_.find(name);
    if (it == options_.end() || it->second.empty()) return fallback;
    return it->second;
}

std::vector<std::string> ArgParser::missing(const std::vector<std::string>& required) const {
    std::vector<std::string> out;
    for (const auto& name : required) {
        if (get(name).empty()) out.push_back(name);
    }
    return out;
}

} // namespace candlecast::config
